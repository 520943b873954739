#pragma once

#include <catch2/catch_test_macros.hpp>

#include "groove/height_synth.hpp"

#include <string>
#include <utility>

namespace vinyl::test {

/// Build a synthesizer for a config the test expects to be valid.
inline groove::HeightSynthesizer make_synth(
    const GrooveConfig& config, groove::HashFn hash = groove::groove_hash) {
    auto synth = groove::HeightSynthesizer::create(config, std::move(hash));
    INFO((synth.ok() ? std::string() : synth.error().message));
    REQUIRE(synth.ok());
    return synth.take_value();
}

} // namespace vinyl::test
