/* Copyright (c) 2026 The pdfredact Authors
 *
 * This file is part of pdfredact.
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

#ifndef PDFREDACT_CONSTANTS_H
#define PDFREDACT_CONSTANTS_H

/*
 * Keep this file 'C' compatible. New values must be added to the end
 * so that no constant's numerical value changes; callers that only
 * see the numbers (reports, exit codes) depend on them.
 */

/* Exit codes from the pdfredact CLI */

enum pdfredact_exit_code_e {
    pdfredact_exit_success = 0,
    pdfredact_exit_error = 2,
};

/* Error codes carried by RedactExc */

enum pdfredact_error_code_e {
    pdfredact_e_success = 0,
    pdfredact_e_input,      /* missing or empty input */
    pdfredact_e_format,     /* not a PDF, or damaged beyond parsing */
    pdfredact_e_protection, /* a password is required to open the file */
    pdfredact_e_extraction, /* text or position enumeration failed */
    pdfredact_e_redaction,  /* rewriting or saving the document failed */
    pdfredact_e_validation, /* the rewritten document failed verification */
    pdfredact_e_size,       /* input larger than the configured limit */
};

/* Kinds of personally identifiable information */

enum pdfredact_pii_type_e {
    pdfredact_pii_email = 0,
    pdfredact_pii_phone,
};

/* Protection state of an input document */

enum pdfredact_protection_e {
    pdfredact_p_none = 0,      /* not encrypted */
    pdfredact_p_recoverable,   /* encrypted, opens with the empty password */
    pdfredact_p_unrecoverable, /* a password is required */
};

#endif /* PDFREDACT_CONSTANTS_H */
