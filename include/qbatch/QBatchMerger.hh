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

#ifndef QBATCHMERGER_HH
#define QBATCHMERGER_HH

#include <qbatch/DLL.h>
#include <qbatch/QBatchOperation.hh>

#include <memory>
#include <string>
#include <vector>

class QPDF;

// QBatchMerger writes every page of every entry, in position order, to a single PDF file. PDF
// pages are copied unchanged, JPG files become one page each with the original JPEG data, and
// each frame of a TIFF file becomes a page with losslessly compressed RGB data.
//
// The output is first written to "<output>.~qbatch-temp#" and renamed to the output file only
// after it has been completely written. If the merge fails or is cancelled, the temporary file
// is removed and any existing output file is left alone. The first error aborts the merge and is
// thrown as a QBatchExc naming the offending entry.
//
// Progress is reported as (i, n + 1) after each of the n entries and as (n + 1, n + 1) after the
// file is written.
class QBatchMerger: public QBatchOperation
{
  public:
    // The output file name is passed through normalizeOutputFilename.
    QBATCH_DLL
    QBatchMerger(std::vector<QBatchEntry> const& entries, std::string const& outfile);
    QBATCH_DLL
    ~QBatchMerger() override;

    QBATCH_DLL
    QBatchResult run() override;
    QBATCH_DLL
    std::string getDescription() const override;

    QBATCH_DLL
    std::string const& getOutputFilename() const;

    // Return filename with its extension replaced by ".pdf", or with ".pdf" appended if it has no
    // extension. A name that already ends with ".pdf" in any case is returned unchanged. Throws
    // QBatchExc with qbatch_e_invalid_name if filename is empty.
    QBATCH_DLL
    static std::string normalizeOutputFilename(std::string const& filename);

  private:
    size_t addEntry(QPDF& pdf, QBatchEntry const& entry);
    size_t addPDF(QPDF& pdf, QBatchEntry const& entry);
    size_t addJPG(QPDF& pdf, QBatchEntry const& entry);
    size_t addTIFF(QPDF& pdf, QBatchEntry const& entry);
    void write(QPDF& pdf);

    class Members;
    std::unique_ptr<Members> m;
};

#endif // QBATCHMERGER_HH
