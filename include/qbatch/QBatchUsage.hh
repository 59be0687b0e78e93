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

#ifndef QBATCHUSAGE_HH
#define QBATCHUSAGE_HH

#include <qbatch/DLL.h>

#include <stdexcept>
#include <string>

// Thrown by QBatchJob for command-line and command-file errors.
class QBATCH_DLL_CLASS QBatchUsage: public std::runtime_error
{
  public:
    QBATCH_DLL
    QBatchUsage(std::string const& msg);
};

#endif // QBATCHUSAGE_HH
