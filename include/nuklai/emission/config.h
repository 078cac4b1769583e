// NUKLAI - Emission Configuration
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Parameters of the emission ledger, read from the [emission] section:
//
//   [emission]
//   maxsupply=10000000000000000000   # base units, used when no cap is supplied
//   baseaprbps=2500                  # 25% APR up to basevalidators
//   basevalidators=100
//   epochlength=10                   # blocks per reward epoch
//   secondsperblock=3
//   secondsperyear=31536000
//   emissionaddress=nai1...          # bech32, optional
//   hrp=nai

#ifndef NUKLAI_EMISSION_CONFIG_H
#define NUKLAI_EMISSION_CONFIG_H

#include "nuklai/core/types.h"
#include "nuklai/emission/status.h"

#include <cstdint>
#include <string>

namespace nuklai {

namespace util {
class ConfigManager;
}

namespace emission {

/// Default supply cap: 10 billion NAI
constexpr Amount DEFAULT_MAX_SUPPLY = 10000000000ULL * COIN;

constexpr uint64_t DEFAULT_BASE_APR_BPS = 2500;
constexpr uint64_t DEFAULT_BASE_VALIDATORS = 100;
constexpr uint64_t DEFAULT_EPOCH_LENGTH = 10;
constexpr uint64_t DEFAULT_SECONDS_PER_BLOCK = 3;
constexpr uint64_t DEFAULT_SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;

/// Upper bound on basevalidators (keeps APR rationals small)
constexpr uint64_t MAX_BASE_VALIDATORS = 100000;

struct EmissionConfig {
    Amount maxSupply{DEFAULT_MAX_SUPPLY};
    uint64_t baseAprBps{DEFAULT_BASE_APR_BPS};
    uint64_t baseValidators{DEFAULT_BASE_VALIDATORS};
    uint64_t epochLength{DEFAULT_EPOCH_LENGTH};
    uint64_t secondsPerBlock{DEFAULT_SECONDS_PER_BLOCK};
    uint64_t secondsPerYear{DEFAULT_SECONDS_PER_YEAR};
    Address emissionAddress;
    std::string hrp{"nai"};

    /**
     * Check parameter bounds:
     * - maxsupply, epochlength, secondsperblock, secondsperyear non-zero
     * - baseaprbps at most 10000
     * - basevalidators in 1..MAX_BASE_VALIDATORS
     * - one epoch no longer than one year
     */
    Status Validate() const;

    /**
     * Read the [emission] section. Missing keys keep their defaults;
     * malformed values and failed validation are INVALID_ARGUMENT.
     */
    static Status FromConfig(const util::ConfigManager& config, EmissionConfig* out);

    std::string ToString() const;
};

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_CONFIG_H
