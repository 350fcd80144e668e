#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <biovoltron/utility/istring.hpp>

#include "probescan/sequence/validator.hpp"

namespace probescan {

/**
 * @brief reverse complement of a DNA sequence, A <-> T and G <-> C
 *
 * @param seq sequence in any case
 * @return uppercase reverse complement, or `std::nullopt` if `seq` has a base
 * other than A, T, G, C
 */
inline auto reverse_complement(std::string_view seq)
    -> std::optional<std::string> {
  if (!is_valid(seq)) {
    return std::nullopt;
  }
  return bio::Codec::rev_comp(normalize(seq));
}

}  // namespace probescan
