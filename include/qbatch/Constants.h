/* Copyright (c) 2026 The qbatch Authors
 *
 * This file is part of qbatch.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef QBATCHCONSTANTS_H
#define QBATCHCONSTANTS_H

/*
 * REMEMBER:
 *
 * Keep this file 'C' compatible. New values must be added to the end
 * of each enumerated type so that no constant's numerical value
 * changes.
 */

/* Exit Codes from QBatchJob and the qbatch CLI */

enum qbatch_exit_code_e {
    qbatch_exit_success = 0,
    qbatch_exit_error = 2,
    qbatch_exit_warning = 3,
};

/* Error Codes */

enum qbatch_error_code_e {
    qbatch_e_success = 0,
    qbatch_e_internal,           /* logic/programming error -- indicates bug */
    qbatch_e_unsupported_format, /* extension is not pdf, tif/tiff, or jpg/jpeg */
    qbatch_e_not_found,          /* no entry with the given id */
    qbatch_e_out_of_range,       /* position outside 0..n-1 */
    qbatch_e_duplicate_name,     /* another entry already has this name */
    qbatch_e_source_missing,     /* source file vanished or is unreadable */
    qbatch_e_corrupt_source,     /* source can't be parsed */
    qbatch_e_write_permission,   /* output location is not writable */
    qbatch_e_batch_locked,       /* an operation over the batch is in flight */
    qbatch_e_invalid_name,       /* display name is empty or contains a path separator */
    qbatch_e_system,             /* other I/O error */
};

/* Kind of document an entry refers to; fixed when the entry is added */

enum qbatch_entry_kind_e {
    qbatch_k_pdf = 0,
    qbatch_k_tiff,
    qbatch_k_jpg,
};

/* What export does when an output file already exists */

enum qbatch_collision_e {
    qbatch_c_rename = 0, /* write name_1.jpg, name_2.jpg, ... instead */
    qbatch_c_overwrite,  /* replace the existing file */
};

/* Final state of a merge or export operation */

enum qbatch_status_e {
    qbatch_s_completed = 0,
    qbatch_s_cancelled,
    qbatch_s_failed,
};

#endif /* QBATCHCONSTANTS_H */
