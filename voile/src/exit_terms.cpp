// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "voile/exit_terms.hpp"

#include "voile/errors.hpp"

namespace voile {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void checkBasisPoints(uint16_t min_rate_bps, uint16_t max_slippage_bps) {
  if (min_rate_bps > kMaxBasisPoints) {
    throw InvalidExitNote("min_rate_bps " + std::to_string(min_rate_bps) + " exceeds " +
                          std::to_string(kMaxBasisPoints));
  }
  if (max_slippage_bps > kMaxBasisPoints) {
    throw InvalidExitNote("max_slippage_bps " + std::to_string(max_slippage_bps) + " exceeds " +
                          std::to_string(kMaxBasisPoints));
  }
}

void need(size_t size, size_t wanted, const char* what) {
  if (size < wanted) throw InvalidExitNote(std::string{"truncated terms payload: "} + what);
}

}  // namespace

Custom makeCustomTerms(uint16_t min_rate_bps, uint16_t max_slippage_bps) {
  checkBasisPoints(min_rate_bps, max_slippage_bps);
  return Custom{min_rate_bps, max_slippage_bps};
}

void validateTerms(const ExitTerms& terms) {
  if (const auto* custom = std::get_if<Custom>(&terms)) {
    checkBasisPoints(custom->min_rate_bps, custom->max_slippage_bps);
  }
}

Bytes encodeTerms(const ExitTerms& terms) {
  validateTerms(terms);
  Bytes out;
  std::visit(overloaded{[&](const Immediate&) { out.push_back(static_cast<uint8_t>(TermsTag::Immediate)); },
                        [&](const Standard&) { out.push_back(static_cast<uint8_t>(TermsTag::Standard)); },
                        [&](const Delayed& d) {
                          out.push_back(static_cast<uint8_t>(TermsTag::Delayed));
                          const auto blocks = util::toBigEndianArrayBuffer(d.blocks);
                          out.insert(out.end(), blocks.begin(), blocks.end());
                        },
                        [&](const Custom& c) {
                          out.push_back(static_cast<uint8_t>(TermsTag::Custom));
                          const auto rate = util::toBigEndianArrayBuffer(c.min_rate_bps);
                          const auto slippage = util::toBigEndianArrayBuffer(c.max_slippage_bps);
                          out.insert(out.end(), rate.begin(), rate.end());
                          out.insert(out.end(), slippage.begin(), slippage.end());
                        }},
             terms);
  return out;
}

ExitTerms decodeTerms(const uint8_t* buf, size_t size, size_t& consumed) {
  if (size == 0) throw InvalidExitNote("empty terms encoding");
  switch (static_cast<TermsTag>(buf[0])) {
    case TermsTag::Immediate:
      consumed = 1;
      return Immediate{};
    case TermsTag::Standard:
      consumed = 1;
      return Standard{};
    case TermsTag::Delayed:
      need(size, 1 + sizeof(uint64_t), "delayed");
      consumed = 1 + sizeof(uint64_t);
      return Delayed{util::fromBigEndianBuffer<uint64_t>(buf + 1)};
    case TermsTag::Custom: {
      need(size, 1 + 2 * sizeof(uint16_t), "custom");
      consumed = 1 + 2 * sizeof(uint16_t);
      return makeCustomTerms(util::fromBigEndianBuffer<uint16_t>(buf + 1), util::fromBigEndianBuffer<uint16_t>(buf + 3));
    }
  }
  throw InvalidExitNote("unknown terms tag " + std::to_string(buf[0]));
}

ExitTerms decodeTerms(const Bytes& buf) {
  size_t consumed = 0;
  auto terms = decodeTerms(buf.data(), buf.size(), consumed);
  if (consumed != buf.size()) throw InvalidExitNote("trailing bytes after terms encoding");
  return terms;
}

std::ostream& operator<<(std::ostream& os, const ExitTerms& terms) {
  std::visit(overloaded{[&](const Immediate&) { os << "Immediate"; },
                        [&](const Standard&) { os << "Standard"; },
                        [&](const Delayed& d) { os << "Delayed{blocks: " << d.blocks << "}"; },
                        [&](const Custom& c) {
                          os << "Custom{min_rate_bps: " << c.min_rate_bps
                             << ", max_slippage_bps: " << c.max_slippage_bps << "}";
                        }},
             terms);
  return os;
}

}  // namespace voile
