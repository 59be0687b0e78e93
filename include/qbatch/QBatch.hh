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

#ifndef QBATCH_HH
#define QBATCH_HH

#include <qbatch/DLL.h>
#include <qbatch/QBatchEntry.hh>
#include <qbatch/QBatchExc.hh>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// A change to a batch, delivered to the batch's change handler after
// the change has been made. For ev_added, old_position is the same as
// new_position. For ev_removed, new_position is meaningless. Names are
// filled in for ev_renamed and carry the entry's name otherwise.
struct QBatchEvent
{
    enum type_e { ev_added, ev_removed, ev_moved, ev_renamed };

    type_e type;
    int entry_id;
    size_t old_position;
    size_t new_position;
    std::string old_name;
    std::string new_name;
};

// QBatch is the ordered working set of documents for one session.
// Entries are identified by the id assigned when they are added.
// Positions always run from 0 to size() - 1, and display names are
// unique without regard to case.
//
// Every mutation either succeeds completely or throws QBatchExc and
// leaves the batch unchanged. While the batch is locked, which
// QBatchSession does while a merge or export is in flight, every
// mutation throws QBatchExc with qbatch_e_batch_locked.
class QBatch
{
  public:
    struct AddResult
    {
        // Ids of entries that were appended, in order
        std::vector<int> added;
        // One exception for each path that was not accepted
        std::vector<QBatchExc> rejected;
        // Paths that were already in the batch
        std::vector<std::string> skipped;
    };

    QBATCH_DLL
    QBatch();
    QBATCH_DLL
    ~QBatch();
    QBatch(QBatch const&) = delete;
    QBatch& operator=(QBatch const&) = delete;

    // Append files in the order given. Files whose extensions are not
    // supported are rejected with qbatch_e_unsupported_format, and
    // files that don't exist or can't be read are rejected with
    // qbatch_e_source_missing. Rejection of one file doesn't prevent
    // others from being added. A file whose absolute path is already
    // in the batch is skipped. Each new entry's display name is the
    // file's base name, with _1, _2, ... appended to the stem if
    // needed to keep names unique.
    QBATCH_DLL
    AddResult addFiles(std::vector<std::string> const& paths);

    QBATCH_DLL
    void remove(int id);

    // Move an entry to new_position, shifting the entries in between.
    // Throws qbatch_e_out_of_range unless 0 <= new_position < size().
    QBATCH_DLL
    void reorder(int id, int new_position);

    // Change an entry's display name. Surrounding white space is
    // removed. If the new name has no extension, the current one is
    // kept; an extension for a different kind of document is rejected
    // with qbatch_e_unsupported_format. Renaming to the current name
    // does nothing.
    QBATCH_DLL
    void rename(int id, std::string const& new_name);

    // Move each of the given entries by offset positions, as a move
    // up (negative offset) or move down (positive offset) of a
    // selection. Entries are processed starting from the edge they
    // are moving toward so that adjacent entries move together. An
    // entry whose target position is out of range is left in place.
    QBATCH_DLL
    void moveEntries(std::vector<int> const& ids, int offset);

    QBATCH_DLL
    size_t size() const;
    QBATCH_DLL
    bool empty() const;

    // All entries in position order
    QBATCH_DLL
    std::vector<QBatchEntry> const& getEntries() const;

    // Throws qbatch_e_not_found if there is no such entry
    QBATCH_DLL
    QBatchEntry const& getEntry(int id) const;

    QBATCH_DLL
    bool contains(int id) const;

    // Returns nullptr if no entry has this name, compared without
    // regard to case
    QBATCH_DLL
    QBatchEntry const* findByName(std::string const& name) const;

    // The handler is called after each successful change. Passing an
    // empty function removes the handler.
    QBATCH_DLL
    void setChangeHandler(std::function<void(QBatchEvent const&)>);

    QBATCH_DLL
    bool isLocked() const;
    QBATCH_DLL
    void lock();
    QBATCH_DLL
    void unlock();

  private:
    size_t indexOf(int id) const;
    void checkUnlocked() const;
    std::string uniqueName(std::string const& name) const;
    bool nameInUse(std::string const& name, int except_id) const;
    void renumber();
    void notify(QBatchEvent const&);

    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCH_HH
