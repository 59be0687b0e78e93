#include <qbatch/QBatchExc.hh>

QBatchExc::QBatchExc(
    qbatch_error_code_e error_code,
    std::string const& filename,
    std::string const& entry,
    std::string const& message) :
    std::runtime_error(createWhat(filename, entry, message)),
    error_code(error_code),
    filename(filename),
    entry(entry),
    message(message)
{
}

std::string
QBatchExc::createWhat(
    std::string const& filename, std::string const& entry, std::string const& message)
{
    std::string result;
    if (!entry.empty()) {
        result += entry;
    }
    if (!filename.empty()) {
        if (!entry.empty()) {
            result += " (" + filename + ")";
        } else {
            result += filename;
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

qbatch_error_code_e
QBatchExc::getErrorCode() const
{
    return this->error_code;
}

std::string const&
QBatchExc::getFilename() const
{
    return this->filename;
}

std::string const&
QBatchExc::getEntry() const
{
    return this->entry;
}

std::string const&
QBatchExc::getMessageDetail() const
{
    return this->message;
}

char const*
QBatchExc::errorCodeName(qbatch_error_code_e code)
{
    switch (code) {
    case qbatch_e_success:
        return "Success";
    case qbatch_e_internal:
        return "Internal";
    case qbatch_e_unsupported_format:
        return "UnsupportedFormat";
    case qbatch_e_not_found:
        return "NotFound";
    case qbatch_e_out_of_range:
        return "OutOfRange";
    case qbatch_e_duplicate_name:
        return "DuplicateName";
    case qbatch_e_source_missing:
        return "SourceMissing";
    case qbatch_e_corrupt_source:
        return "CorruptSource";
    case qbatch_e_write_permission:
        return "WritePermissionDenied";
    case qbatch_e_batch_locked:
        return "BatchLocked";
    case qbatch_e_invalid_name:
        return "InvalidName";
    case qbatch_e_system:
        return "SystemError";
    }
    return "Unknown";
}
