// NUKLAI - Emission Configuration Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/config.h"

#include "nuklai/core/bech32.h"
#include "nuklai/emission/fixed_point.h"
#include "nuklai/util/config.h"
#include "nuklai/util/logging.h"

#include <sstream>

namespace nuklai {
namespace emission {

namespace {

Status ReadUInt(const util::ConfigManager& config, const char* key, uint64_t* value) {
    if (!config.HasKey(key, util::ConfigKeys::SECTION_EMISSION)) {
        return Status::Ok();
    }
    auto parsed = config.TryGetUInt(key, util::ConfigKeys::SECTION_EMISSION);
    if (!parsed) {
        return Status::InvalidArgument(std::string("emission.") + key +
                                       " is not an unsigned integer");
    }
    *value = *parsed;
    return Status::Ok();
}

} // namespace

Status EmissionConfig::Validate() const {
    if (maxSupply == 0) {
        return Status::InvalidArgument("maxsupply must be positive");
    }
    if (baseAprBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("baseaprbps must be at most 10000");
    }
    if (baseValidators == 0 || baseValidators > MAX_BASE_VALIDATORS) {
        return Status::InvalidArgument("basevalidators must be between 1 and " +
                                       std::to_string(MAX_BASE_VALIDATORS));
    }
    if (epochLength == 0) {
        return Status::InvalidArgument("epochlength must be positive");
    }
    if (secondsPerBlock == 0) {
        return Status::InvalidArgument("secondsperblock must be positive");
    }
    if (secondsPerYear == 0) {
        return Status::InvalidArgument("secondsperyear must be positive");
    }
    if (epochLength > secondsPerYear / secondsPerBlock) {
        return Status::InvalidArgument("an epoch must not be longer than a year");
    }
    if (hrp.empty()) {
        return Status::InvalidArgument("hrp must not be empty");
    }
    return Status::Ok();
}

Status EmissionConfig::FromConfig(const util::ConfigManager& config, EmissionConfig* out) {
    using namespace util::ConfigKeys;

    EmissionConfig result;
    Status s;
    if (!(s = ReadUInt(config, MAXSUPPLY, &result.maxSupply)).ok() ||
        !(s = ReadUInt(config, BASEAPRBPS, &result.baseAprBps)).ok() ||
        !(s = ReadUInt(config, BASEVALIDATORS, &result.baseValidators)).ok() ||
        !(s = ReadUInt(config, EPOCHLENGTH, &result.epochLength)).ok() ||
        !(s = ReadUInt(config, SECONDSPERBLOCK, &result.secondsPerBlock)).ok() ||
        !(s = ReadUInt(config, SECONDSPERYEAR, &result.secondsPerYear)).ok()) {
        return s;
    }

    result.hrp = config.GetString(HRP, result.hrp, SECTION_EMISSION);

    std::string address = config.GetString(EMISSIONADDRESS, "", SECTION_EMISSION);
    if (!address.empty()) {
        auto decoded = DecodeAddress(result.hrp, address);
        if (!decoded) {
            return Status::InvalidArgument("emission.emissionaddress is not a valid '" +
                                           result.hrp + "' address");
        }
        result.emissionAddress = *decoded;
    }

    s = result.Validate();
    if (!s.ok()) {
        return s;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << result.ToString();
    *out = result;
    return Status::Ok();
}

std::string EmissionConfig::ToString() const {
    std::ostringstream ss;
    ss << "EmissionConfig {"
       << " maxSupply: " << FormatAmount(maxSupply)
       << ", baseApr: " << Rate{baseAprBps, BPS_DENOMINATOR}.ToString()
       << ", baseValidators: " << baseValidators
       << ", epochLength: " << epochLength
       << ", secondsPerBlock: " << secondsPerBlock
       << " }";
    return ss.str();
}

} // namespace emission
} // namespace nuklai
