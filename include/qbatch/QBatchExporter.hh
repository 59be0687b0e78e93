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

#ifndef QBATCHEXPORTER_HH
#define QBATCHEXPORTER_HH

#include <qbatch/Constants.h>
#include <qbatch/DLL.h>
#include <qbatch/QBatchOperation.hh>

#include <functional>
#include <memory>
#include <string>
#include <vector>

class Pipeline;
struct RGBImage;

// QBatchExporter writes every entry of a batch as JPG files into a directory. Each PDF page is
// rendered at the configured resolution, each TIFF frame is converted at its own size, and JPG
// entries are copied byte for byte. Files are named
//
//   {position}_{stem}_{index}.jpg   for pages and frames
//   {position}_{stem}.jpg           for copied JPG files
//
// where position is the entry's one-based position and index is the one-based page or frame
// number. Both are zero-padded to at least three digits, or to as many digits as the largest
// value needs. stem is the entry's display name without its extension.
//
// A failure on one entry is recorded in the result, logged as a warning, and does not stop the
// export. Only failure to create the destination directory is thrown. Progress is reported as
// (i, n) after each of the n entries.
class QBatchExporter: public QBatchOperation
{
  public:
    struct Options
    {
        // Resolution for rendering PDF pages
        int dpi{200};
        // JPEG quality, 1 to 100
        int quality{90};
        qbatch_collision_e collision{qbatch_c_rename};
    };

    // Throws QBatchExc with qbatch_e_out_of_range if dpi or quality are out of range.
    QBATCH_DLL
    QBatchExporter(std::vector<QBatchEntry> const& entries, std::string const& directory);
    QBATCH_DLL
    QBatchExporter(
        std::vector<QBatchEntry> const& entries,
        std::string const& directory,
        Options const& options);
    QBATCH_DLL
    ~QBatchExporter() override;

    QBATCH_DLL
    QBatchResult run() override;
    QBATCH_DLL
    std::string getDescription() const override;

    QBATCH_DLL
    std::string const& getDirectory() const;
    QBATCH_DLL
    Options const& getOptions() const;

    // Largest accepted value for Options::dpi
    static int const max_dpi = 2400;

  private:
    void exportEntry(QBatchEntry const& entry, std::string const& prefix, QBatchResult& result);
    std::string targetPath(std::string const& name) const;
    void writeOutput(
        QBatchEntry const& entry,
        std::string const& target,
        std::function<void(Pipeline*)> fn);
    void encode(RGBImage const& image, Pipeline* p) const;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCHEXPORTER_HH
