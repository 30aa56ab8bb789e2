// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/logstore.h>

namespace ansitok
{

auto inline tokenizerLog = logstore::category("ansitok.tokenizer");
auto inline sgrLog = logstore::category("ansitok.sgr");

} // namespace ansitok
