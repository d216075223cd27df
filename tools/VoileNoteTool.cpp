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

#include <iostream>
#include <map>
#include <string>

#include "Logger.hpp"
#include "string.hpp"
#include "voile/config.hpp"
#include "voile/errors.hpp"
#include "voile/exit_note.hpp"
#include "voile/proof_generator.hpp"
#include "voile/proof_verifier.hpp"

// Helper functions and static state to this executable's main function.

static bool containsHelpOption(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help") {
      return true;
    }
  }
  return false;
}

// Collects "--name value" pairs following the command word.
static std::map<std::string, std::string> parseOptions(int argc, char** argv) {
  std::map<std::string, std::string> options;
  for (int i = 2; i < argc; ++i) {
    const std::string name = argv[i];
    if (name.rfind("--", 0) != 0 || i + 1 >= argc) {
      throw std::invalid_argument("expected --option value, got: " + name);
    }
    options[name.substr(2)] = argv[++i];
  }
  return options;
}

static const std::string& required(const std::map<std::string, std::string>& options, const std::string& name) {
  auto it = options.find(name);
  if (it == options.end()) throw std::invalid_argument("missing required option --" + name);
  return it->second;
}

// immediate | standard | delayed:<blocks> | custom:<min_rate_bps>:<max_slippage_bps>
static voile::ExitTerms parseTerms(const std::string& text) {
  const auto parts = voile::util::split(text, ':');
  if (parts[0] == "immediate" && parts.size() == 1) return voile::Immediate{};
  if (parts[0] == "standard" && parts.size() == 1) return voile::Standard{};
  if (parts[0] == "delayed" && parts.size() == 2) {
    return voile::Delayed{static_cast<uint64_t>(voile::util::to<unsigned long long>(parts[1]))};
  }
  if (parts[0] == "custom" && parts.size() == 3) {
    const auto rate = voile::util::to<unsigned long>(parts[1]);
    const auto slippage = voile::util::to<unsigned long>(parts[2]);
    if (rate > voile::kMaxBasisPoints || slippage > voile::kMaxBasisPoints) {
      throw voile::InvalidExitNote("basis points must be at most " + std::to_string(voile::kMaxBasisPoints));
    }
    return voile::makeCustomTerms(static_cast<uint16_t>(rate), static_cast<uint16_t>(slippage));
  }
  throw std::invalid_argument("unrecognized terms: " + text);
}

static voile::ExitNote noteFromOptions(const std::map<std::string, std::string>& options) {
  const auto amount = voile::util::to<unsigned long long>(required(options, "amount"));
  const auto owner = voile::util::unhex(required(options, "owner"));
  auto it = options.find("terms");
  const auto terms = it == options.end() ? voile::ExitTerms{voile::Standard{}} : parseTerms(it->second);
  return voile::ExitNote::create(amount, owner, terms);
}

static int commitCommand(const std::map<std::string, std::string>& options) {
  const auto note = noteFromOptions(options);
  std::cout << "note: " << note << "\n";
  std::cout << "commitment: " << note.commitment() << "\n";
  auto it = options.find("key");
  if (it != options.end()) {
    const auto key = voile::EncryptionKey::fromHex(it->second);
    std::cout << "sealed: " << voile::util::toHex(note.encrypt(key).serialize(), true) << "\n";
  }
  return 0;
}

static int proveCommand(const std::map<std::string, std::string>& options) {
  const auto config = voile::VerifierConfig::loadFromFile(required(options, "config"));
  if (!config.log_config.empty()) logging::initLogger(config.log_config);

  const auto note = noteFromOptions(options);
  const auto secret = voile::util::unhex(required(options, "secret"));
  const voile::ProofGenerator generator{voile::DomainSeparator{config.domain_separator}};
  const auto proof = generator.generate(note, secret);
  const auto binding = generator.ownerBinding(secret);
  std::cout << "binding: " << voile::toHex(binding) << "\n";
  std::cout << "commitment: " << proof.commitment << "\n";
  std::cout << "proof: " << proof << "\n";

  voile::ProofVerifier verifier{config};
  verifier.registerCommitment(proof.commitment, binding);
  const auto status = verifier.verifyAndConsume(proof);
  std::cout << "result: " << status << "\n";
  return status == voile::VerifyStatus::Ok ? 0 : 2;
}

/**
 * Main function for the voile_note_tool executable. Creates exit notes and prints their
 * commitments, optionally sealing them under a key, or generates a proof for a note and runs it
 * through a verifier built from a configuration file.
 *
 * @return 0 on success, 1 on invalid input, 2 when the proof is rejected.
 */
int main(int argc, char** argv) {
  const std::string usageMessage =
      "Usage:\n"
      "voile_note_tool commit --amount N --owner HEX [--terms TERMS] [--key HEX]\n"
      "  Creates a note and prints its id and commitment. With --key also prints the sealed note.\n"
      "voile_note_tool prove --config FILE --amount N --owner HEX --secret HEX [--terms TERMS]\n"
      "  Creates a note, prints the owner binding and exit proof, then verifies and consumes the\n"
      "  proof against the nullifier store named in FILE.\n"
      "TERMS is one of: immediate, standard (default), delayed:<blocks>,\n"
      "  custom:<min_rate_bps>:<max_slippage_bps>\n"
      "Owner, secret and key are 32 bytes of hex, with or without a 0x prefix.\n"
      "Special options:\n  --help : display this usage message and exit.\n";

  if ((argc <= 1) || (containsHelpOption(argc, argv))) {
    std::cout << usageMessage;
    return 0;
  }

  try {
    const std::string command = argv[1];
    const auto options = parseOptions(argc, argv);
    if (command == "commit") return commitCommand(options);
    if (command == "prove") return proveCommand(options);
    std::cerr << "Unknown command: " << command << "\n" << usageMessage;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
}
