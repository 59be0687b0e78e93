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

#ifndef QBATCHENTRY_HH
#define QBATCHENTRY_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>

#include <cstddef>
#include <string>

// One document in a batch. Entries are created only by QBatch. The
// id, source path, and kind never change; the display name and
// position are maintained by QBatch. Copies of entries are plain
// values and are what merge and export operations work from.
class QBatchEntry
{
  public:
    QBATCH_DLL
    int getId() const;

    // Absolute path of the file this entry refers to
    QBATCH_DLL
    std::string const& getSourcePath() const;

    QBATCH_DLL
    std::string const& getDisplayName() const;

    QBATCH_DLL
    qbatch_entry_kind_e getKind() const;

    // Zero-based rank of the entry within its batch
    QBATCH_DLL
    size_t getPosition() const;

    // Determine the kind of document from a file name's extension:
    // .pdf, .tif, .tiff, .jpg, or .jpeg, without regard to case.
    // Returns false if the extension is not supported. If kind is not
    // null, it is set when the extension is supported.
    QBATCH_DLL
    static bool kindForFilename(std::string const& filename, qbatch_entry_kind_e* kind = nullptr);

    // "PDF", "TIFF", or "JPG"
    QBATCH_DLL
    static char const* kindName(qbatch_entry_kind_e);

  private:
    friend class QBatch;

    QBatchEntry(
        int id,
        std::string const& source_path,
        std::string const& display_name,
        qbatch_entry_kind_e kind,
        size_t position);

    int id;
    std::string source_path;
    std::string display_name;
    qbatch_entry_kind_e kind;
    size_t position;
};

#endif // QBATCHENTRY_HH
