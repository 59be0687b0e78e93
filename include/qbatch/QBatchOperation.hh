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

#ifndef QBATCHOPERATION_HH
#define QBATCHOPERATION_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>
#include <qbatch/QBatchEntry.hh>
#include <qbatch/QBatchExc.hh>

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// The outcome of a merge or export. An operation that completed with per-entry failures has
// status qbatch_s_completed and a non-empty failure list.
struct QBatchResult
{
    qbatch_status_e status{qbatch_s_completed};

    // Ids of entries that were fully processed
    std::vector<int> succeeded;
    std::vector<QBatchExc> failures;

    // Files written, in the order they were written
    std::vector<std::string> outputs;

    // Pages written to the merged file, or images written by an export
    size_t pages{0};
};

// QBatchOperation is the base class for long-running operations over a snapshot of a batch's
// entries. The entries are copied when the operation is constructed, so the operation is not
// affected by later changes to the batch. An operation may be run on a thread other than the
// one that created it; cancel() may be called from any thread.
class QBatchOperation
{
  public:
    typedef std::function<void(size_t current, size_t total)> progress_reporter_t;

    QBATCH_DLL
    virtual ~QBatchOperation();

    QBatchOperation(QBatchOperation const&) = delete;
    QBatchOperation& operator=(QBatchOperation const&) = delete;

    // Perform the operation. Fatal errors are thrown as QBatchExc. A cancelled operation
    // returns normally with status qbatch_s_cancelled.
    QBATCH_DLL
    virtual QBatchResult run() = 0;

    // Short description of the operation for messages, such as "merge into out.pdf".
    QBATCH_DLL
    virtual std::string getDescription() const = 0;

    // Request cancellation. The operation stops at its next check, which happens between
    // entries.
    QBATCH_DLL
    void cancel();
    QBATCH_DLL
    bool isCancelled() const;

    // The reporter is called on the thread that runs the operation.
    QBATCH_DLL
    void setProgressReporter(progress_reporter_t);

    // By default, operations log through QPDFLogger::defaultLogger().
    QBATCH_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);
    QBATCH_DLL
    std::shared_ptr<QPDFLogger> getLogger() const;

    QBATCH_DLL
    void setVerbose(bool);

    // Prefix used for verbose messages; defaults to "qbatch".
    QBATCH_DLL
    void setMessagePrefix(std::string const&);
    QBATCH_DLL
    std::string const& getMessagePrefix() const;

    QBATCH_DLL
    std::vector<QBatchEntry> const& getEntries() const;

  protected:
    QBATCH_DLL
    QBatchOperation(std::vector<QBatchEntry> const& entries);

    QBATCH_DLL
    void reportProgress(size_t current, size_t total);

    // Call fn with the logger's info pipeline and the message prefix if verbose is set.
    QBATCH_DLL
    void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn);

  private:
    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCHOPERATION_HH
