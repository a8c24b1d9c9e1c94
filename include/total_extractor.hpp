#pragma once

#include <optional>

#include "config.hpp"
#include "receipt_types.hpp"
#include "sectioner.hpp"

// Grand total by escalating passes: strong labels, bare "total" labels, then
// every line outside bad contexts. `tax` penalizes candidates equal to it.
FieldResult<Cents> extractTotal(const SectionedText& text, const ExtractorConfig& config,
                                const std::optional<Cents>& tax);
