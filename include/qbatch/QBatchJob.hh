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

#ifndef QBATCHJOB_HH
#define QBATCHJOB_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>

#include <qpdf/QPDFLogger.hh>

#include <memory>
#include <string>
#include <vector>

class QBatchSession;

// QBatchJob is the engine behind the qbatch command-line tool. It turns command-line arguments
// and command files into a sequence of actions and runs them against a QBatchSession. The
// actions mirror what a user does in an interactive session: add files, remove, move, and rename
// entries, list the batch, merge, and export. Errors from individual actions are logged and do
// not stop later actions; they are reflected in the exit code.
class QBatchJob
{
  public:
    static int constexpr EXIT_ERROR = qbatch_exit_error;
    static int constexpr EXIT_WARNING = qbatch_exit_warning;

    QBATCH_DLL
    QBatchJob();
    QBATCH_DLL
    ~QBatchJob();

    QBatchJob(QBatchJob const&) = delete;
    QBatchJob& operator=(QBatchJob const&) = delete;

    // Initialize from a null-terminated argv. argv[0] is the program name. Throws QBatchUsage
    // for invalid arguments.
    QBATCH_DLL
    void initializeFromArgv(char const* const argv[]);

    // Append the commands in a command file to the actions. filename "-" reads standard input.
    // Throws QBatchUsage for a malformed command; the line number is included in the message.
    QBATCH_DLL
    void addCommandsFromFile(std::string const& filename);

    // Parse and append one command. Blank lines and lines starting with "#" are ignored.
    QBATCH_DLL
    void addCommand(std::string const& line);

    QBATCH_DLL
    void run();

    // 0 on success, EXIT_ERROR if any action failed, or EXIT_WARNING if any action completed
    // with warnings, such as files that could not be added or exported.
    QBATCH_DLL
    int getExitCode() const;

    QBATCH_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);
    QBATCH_DLL
    std::shared_ptr<QPDFLogger> getLogger() const;

    QBATCH_DLL
    void setMessagePrefix(std::string const&);

    QBATCH_DLL
    static char const* usage();

  private:
    struct Action;
    void runAction(QBatchSession& session, Action const& action);
    int idAtPosition(QBatchSession& session, std::string const& position);
    void list(QBatchSession& session);

    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCHJOB_HH
