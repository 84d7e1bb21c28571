// SPDX-License-Identifier: MIT

#pragma once
#ifdef __cplusplus
extern "C" {
#endif

// Runs the reference reconstruction (ART and simulated HHL).
// options_json is a flat JSON object; supported keys: iterations, relaxation,
// clock_qubits, table, reference_index, pixel_order, uncovered, inversion,
// shots, seed. options_json may be NULL.
// Returns 0 on success; *out_json must be freed with qrecon_free().
// Error returns: 2 bad argument, 3 bad option, 5 degenerate system,
// 6 failed postselection, 7 configuration mismatch, 8 unitarity violation.
int qrecon_run(const char* options_json, char** out_json);

// Message of the last failed qrecon_run on this thread, or "".
const char* qrecon_last_error(void);

// Frees buffers allocated by the library.
void qrecon_free(char* p);

// Returns the compiled library version string.
const char* qrecon_version(void);

#ifdef __cplusplus
}
#endif
