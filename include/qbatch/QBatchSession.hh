// Copyright (c) 2026 The qbatch Authors
//
// This file is part of qbatch.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef QBATCHSESSION_HH
#define QBATCHSESSION_HH

#include <qbatch/DLL.h>
#include <qbatch/QBatch.hh>
#include <qbatch/QBatchExporter.hh>
#include <qbatch/QBatchOperation.hh>

#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <memory>
#include <string>
#include <vector>

// A QBatchSession owns one batch and runs at most one merge or export at a time on a worker
// thread. Starting an operation locks the batch and takes a snapshot of its entries. Progress,
// log output, and completion of the operation are queued by the worker and delivered on the
// thread that calls poll() or wait(); handlers are only ever called from those functions. The
// batch is unlocked when completion is delivered.
//
// All methods other than cancel() must be called from the same thread.
class QBatchSession
{
  public:
    typedef std::function<void(size_t current, size_t total)> progress_handler_t;
    typedef std::function<void(QBatchResult const&)> completion_handler_t;

    QBATCH_DLL
    QBatchSession();
    QBATCH_DLL
    ~QBatchSession();

    QBatchSession(QBatchSession const&) = delete;
    QBatchSession& operator=(QBatchSession const&) = delete;

    QBATCH_DLL
    QBatch& getBatch();

    // Add files to the batch. Rejected and skipped files are logged as warnings.
    QBATCH_DLL
    QBatch::AddResult addFiles(std::vector<std::string> const& paths);

    // Start an operation over a snapshot of the batch. These throw QBatchExc with
    // qbatch_e_batch_locked if an operation is already in progress.
    QBATCH_DLL
    void startMerge(std::string const& outfile);
    QBATCH_DLL
    void startExport(
        std::string const& directory,
        QBatchExporter::Options const& options = QBatchExporter::Options());
    // The operation's logger, verbose flag, message prefix, and progress reporter are replaced
    // by the session's.
    QBATCH_DLL
    void start(std::shared_ptr<QBatchOperation> operation);

    // True from a successful start until completion is delivered
    QBATCH_DLL
    bool isRunning() const;

    // Ask the running operation, if any, to stop. May be called from any thread.
    QBATCH_DLL
    void cancel();

    // Deliver any queued messages without blocking. Returns the number delivered.
    QBATCH_DLL
    size_t poll();

    // Deliver messages until the running operation's completion has been delivered, and return
    // its result. Throws std::logic_error if no operation is running.
    QBATCH_DLL
    QBatchResult wait();

    QBATCH_DLL
    void setProgressHandler(progress_handler_t);
    QBATCH_DLL
    void setCompletionHandler(completion_handler_t);

    // Log output of the session and its operations goes to this logger, which defaults to
    // QPDFLogger::defaultLogger().
    QBATCH_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);
    QBATCH_DLL
    std::shared_ptr<QPDFLogger> getLogger() const;

    QBATCH_DLL
    void setVerbose(bool);
    QBATCH_DLL
    void setMessagePrefix(std::string const&);

  private:
    class Message;
    void post(Message&& message);
    void deliver(Message& message);
    void runOperation(std::shared_ptr<QBatchOperation> operation);
    void setOperation(std::shared_ptr<QBatchOperation> operation);

    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCHSESSION_HH
