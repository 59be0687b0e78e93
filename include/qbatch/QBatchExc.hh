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

#ifndef QBATCHEXC_HH
#define QBATCHEXC_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>

#include <stdexcept>
#include <string>

// All errors detected by the batch model and by the merge and export
// operations are reported by throwing (or, for export, collecting)
// QBatchExc. The error code is one of the qbatch_error_code_e values
// from Constants.h.
class QBATCH_DLL_CLASS QBatchExc: public std::runtime_error
{
  public:
    QBATCH_DLL
    QBatchExc(
        qbatch_error_code_e error_code,
        std::string const& filename,
        std::string const& entry,
        std::string const& message);
    QBATCH_DLL
    ~QBatchExc() noexcept override = default;

    // To get a complete error string, call what(), provided by
    // std::exception. The accessors below return the original values
    // used to create the exception. Only the error code and message
    // are guaranteed to have non-empty values. The entry is the
    // display name of the offending batch entry, if any.

    QBATCH_DLL
    qbatch_error_code_e getErrorCode() const;
    QBATCH_DLL
    std::string const& getFilename() const;
    QBATCH_DLL
    std::string const& getEntry() const;
    QBATCH_DLL
    std::string const& getMessageDetail() const;

    // Return a short, stable name for an error code, such as
    // "DuplicateName", suitable for messages and tests.
    QBATCH_DLL
    static char const* errorCodeName(qbatch_error_code_e);

  private:
    static std::string
    createWhat(std::string const& filename, std::string const& entry, std::string const& message);

    qbatch_error_code_e error_code;
    std::string filename;
    std::string entry;
    std::string message;
};

#endif // QBATCHEXC_HH
