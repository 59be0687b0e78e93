#include <qbatch/QBatchEntry.hh>

#include <qbatch/Util.hh>

QBatchEntry::QBatchEntry(
    int id,
    std::string const& source_path,
    std::string const& display_name,
    qbatch_entry_kind_e kind,
    size_t position) :
    id(id),
    source_path(source_path),
    display_name(display_name),
    kind(kind),
    position(position)
{
}

int
QBatchEntry::getId() const
{
    return this->id;
}

std::string const&
QBatchEntry::getSourcePath() const
{
    return this->source_path;
}

std::string const&
QBatchEntry::getDisplayName() const
{
    return this->display_name;
}

qbatch_entry_kind_e
QBatchEntry::getKind() const
{
    return this->kind;
}

size_t
QBatchEntry::getPosition() const
{
    return this->position;
}

bool
QBatchEntry::kindForFilename(std::string const& filename, qbatch_entry_kind_e* kind)
{
    std::string ext = qbatch::util::path_extension(filename);
    qbatch_entry_kind_e result;
    if (ext == ".pdf") {
        result = qbatch_k_pdf;
    } else if (ext == ".tif" || ext == ".tiff") {
        result = qbatch_k_tiff;
    } else if (ext == ".jpg" || ext == ".jpeg") {
        result = qbatch_k_jpg;
    } else {
        return false;
    }
    if (kind) {
        *kind = result;
    }
    return true;
}

char const*
QBatchEntry::kindName(qbatch_entry_kind_e kind)
{
    switch (kind) {
    case qbatch_k_pdf:
        return "PDF";
    case qbatch_k_tiff:
        return "TIFF";
    case qbatch_k_jpg:
        return "JPG";
    }
    return "unknown";
}
