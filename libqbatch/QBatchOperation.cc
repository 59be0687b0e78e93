#include <qbatch/QBatchOperation.hh>

#include <atomic>

class QBatchOperation::Members
{
  public:
    Members(std::vector<QBatchEntry> const& entries) :
        entries(entries),
        log(QPDFLogger::defaultLogger())
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::vector<QBatchEntry> entries;
    std::atomic<bool> cancelled{false};
    progress_reporter_t progress_reporter;
    std::shared_ptr<QPDFLogger> log;
    bool verbose{false};
    std::string message_prefix{"qbatch"};
};

QBatchOperation::QBatchOperation(std::vector<QBatchEntry> const& entries) :
    m(std::make_unique<Members>(entries))
{
}

QBatchOperation::~QBatchOperation() = default;

void
QBatchOperation::cancel()
{
    m->cancelled = true;
}

bool
QBatchOperation::isCancelled() const
{
    return m->cancelled;
}

void
QBatchOperation::setProgressReporter(progress_reporter_t reporter)
{
    m->progress_reporter = reporter;
}

void
QBatchOperation::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

std::shared_ptr<QPDFLogger>
QBatchOperation::getLogger() const
{
    return m->log;
}

void
QBatchOperation::setVerbose(bool v)
{
    m->verbose = v;
}

void
QBatchOperation::setMessagePrefix(std::string const& prefix)
{
    m->message_prefix = prefix;
}

std::string const&
QBatchOperation::getMessagePrefix() const
{
    return m->message_prefix;
}

std::vector<QBatchEntry> const&
QBatchOperation::getEntries() const
{
    return m->entries;
}

void
QBatchOperation::reportProgress(size_t current, size_t total)
{
    if (m->progress_reporter) {
        m->progress_reporter(current, total);
    }
}

void
QBatchOperation::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn)
{
    if (m->verbose) {
        fn(*m->log->getInfo(), m->message_prefix);
    }
}
