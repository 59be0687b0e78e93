#include <qbatch/QBatchSession.hh>

#include <qbatch/QBatchMerger.hh>

#include <qpdf/Pl_Function.hh>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

class QBatchSession::Message
{
  public:
    enum type_e { m_progress, m_info, m_warn, m_error, m_complete };

    Message(type_e type) :
        type(type)
    {
    }

    type_e type;
    size_t current{0};
    size_t total{0};
    std::string text;
    QBatchResult result;
};

class QBatchSession::Members
{
  public:
    Members() :
        log(QPDFLogger::defaultLogger())
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    QBatch batch;
    std::shared_ptr<QPDFLogger> log;
    bool verbose{false};
    std::string message_prefix{"qbatch"};
    progress_handler_t progress_handler;
    completion_handler_t completion_handler;

    // operation is changed only by the owning thread while holding operation_mutex so that
    // cancel() may read it from elsewhere.
    std::mutex operation_mutex;
    std::shared_ptr<QBatchOperation> operation;
    std::thread worker;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Message> queue;
};

QBatchSession::QBatchSession() :
    m(std::make_unique<Members>())
{
}

QBatchSession::~QBatchSession()
{
    if (m->worker.joinable()) {
        m->operation->cancel();
        m->worker.join();
    }
}

QBatch&
QBatchSession::getBatch()
{
    return m->batch;
}

QBatch::AddResult
QBatchSession::addFiles(std::vector<std::string> const& paths)
{
    auto result = m->batch.addFiles(paths);
    for (auto const& e: result.rejected) {
        m->log->warn(m->message_prefix + ": " + e.what() + "\n");
    }
    for (auto const& path: result.skipped) {
        m->log->warn(m->message_prefix + ": " + path + " is already in the batch; skipping\n");
    }
    return result;
}

void
QBatchSession::startMerge(std::string const& outfile)
{
    start(std::make_shared<QBatchMerger>(m->batch.getEntries(), outfile));
}

void
QBatchSession::startExport(std::string const& directory, QBatchExporter::Options const& options)
{
    start(std::make_shared<QBatchExporter>(m->batch.getEntries(), directory, options));
}

void
QBatchSession::start(std::shared_ptr<QBatchOperation> operation)
{
    if (!operation) {
        throw std::logic_error("QBatchSession::start called with a null operation");
    }
    if (isRunning() || m->batch.isLocked()) {
        throw QBatchExc(
            qbatch_e_batch_locked, "", "", "another merge or export is already in progress");
    }

    // Log output from the worker thread is queued and written to the session's logger when it
    // is delivered.
    auto queue_text = [this](Message::type_e type) {
        return std::make_shared<Pl_Function>(
            "queued log", nullptr, [this, type](unsigned char const* data, size_t len) {
                Message message(type);
                message.text.assign(reinterpret_cast<char const*>(data), len);
                post(std::move(message));
            });
    };
    auto log = QPDFLogger::create();
    log->setInfo(queue_text(Message::m_info));
    log->setWarn(queue_text(Message::m_warn));
    log->setError(queue_text(Message::m_error));
    operation->setLogger(log);
    operation->setVerbose(m->verbose);
    operation->setMessagePrefix(m->message_prefix);
    operation->setProgressReporter([this](size_t current, size_t total) {
        Message message(Message::m_progress);
        message.current = current;
        message.total = total;
        post(std::move(message));
    });

    m->batch.lock();
    setOperation(operation);
    try {
        m->worker = std::thread(&QBatchSession::runOperation, this, operation);
    } catch (std::system_error&) {
        setOperation(nullptr);
        m->batch.unlock();
        throw;
    }
}

void
QBatchSession::runOperation(std::shared_ptr<QBatchOperation> operation)
{
    Message done(Message::m_complete);
    try {
        done.result = operation->run();
    } catch (QBatchExc& e) {
        done.result = QBatchResult();
        done.result.status = qbatch_s_failed;
        done.result.failures.push_back(e);
    } catch (std::exception& e) {
        done.result = QBatchResult();
        done.result.status = qbatch_s_failed;
        done.result.failures.emplace_back(qbatch_e_internal, "", "", e.what());
    }
    post(std::move(done));
}

bool
QBatchSession::isRunning() const
{
    return m->operation != nullptr;
}

void
QBatchSession::setOperation(std::shared_ptr<QBatchOperation> operation)
{
    std::lock_guard<std::mutex> lock(m->operation_mutex);
    m->operation = operation;
}

void
QBatchSession::cancel()
{
    std::lock_guard<std::mutex> lock(m->operation_mutex);
    if (m->operation) {
        m->operation->cancel();
    }
}

void
QBatchSession::post(Message&& message)
{
    {
        std::lock_guard<std::mutex> lock(m->queue_mutex);
        m->queue.push_back(std::move(message));
    }
    m->queue_cv.notify_all();
}

void
QBatchSession::deliver(Message& message)
{
    switch (message.type) {
    case Message::m_progress:
        if (m->progress_handler) {
            m->progress_handler(message.current, message.total);
        }
        break;

    case Message::m_info:
        m->log->info(message.text);
        break;

    case Message::m_warn:
        m->log->warn(message.text);
        break;

    case Message::m_error:
        m->log->error(message.text);
        break;

    case Message::m_complete:
        {
            std::string description = m->operation->getDescription();
            m->worker.join();
            setOperation(nullptr);
            m->batch.unlock();
            if (message.result.status == qbatch_s_failed) {
                for (auto const& e: message.result.failures) {
                    m->log->error(
                        m->message_prefix + ": " + description + " failed: " + e.what() + "\n");
                }
            }
            if (m->completion_handler) {
                m->completion_handler(message.result);
            }
        }
        break;
    }
}

size_t
QBatchSession::poll()
{
    std::deque<Message> messages;
    {
        std::lock_guard<std::mutex> lock(m->queue_mutex);
        messages.swap(m->queue);
    }
    for (auto& message: messages) {
        deliver(message);
    }
    return messages.size();
}

QBatchResult
QBatchSession::wait()
{
    if (!isRunning()) {
        throw std::logic_error("QBatchSession::wait called with no operation in progress");
    }
    while (true) {
        std::deque<Message> messages;
        {
            std::unique_lock<std::mutex> lock(m->queue_mutex);
            m->queue_cv.wait(lock, [this]() { return !m->queue.empty(); });
            messages.swap(m->queue);
        }
        for (auto& message: messages) {
            deliver(message);
            if (message.type == Message::m_complete) {
                return message.result;
            }
        }
    }
}

void
QBatchSession::setProgressHandler(progress_handler_t handler)
{
    m->progress_handler = handler;
}

void
QBatchSession::setCompletionHandler(completion_handler_t handler)
{
    m->completion_handler = handler;
}

void
QBatchSession::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

std::shared_ptr<QPDFLogger>
QBatchSession::getLogger() const
{
    return m->log;
}

void
QBatchSession::setVerbose(bool v)
{
    m->verbose = v;
}

void
QBatchSession::setMessagePrefix(std::string const& prefix)
{
    m->message_prefix = prefix;
}
