#pragma once

#include "metrics/bleu.hpp"

// Driver commands. Inputs come from MLEVAL_* environment variables; each
// command prints to stdout and writes a JSON report when MLEVAL_REPORT is set.

void RunWer();
void RunCer();
void RunBleu();
void RunRanking();
void RunPerplexity();

// BLEU options from MLEVAL_BLEU_ORDER, MLEVAL_BLEU_SMOOTHING (none|epsilon)
// and MLEVAL_BLEU_EPSILON. Throws std::invalid_argument on an unknown
// smoothing name.
metrics::BleuConfig bleu_config_from_env();
