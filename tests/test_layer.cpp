/**
 * @file test_layer.cpp
 * @brief Tests for the layer data model and error types.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "strata/core/decoder.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/layer.hpp"
#include "test_decoders.hpp"

using namespace strata::core;
using strata_test::kApp;
using strata_test::kLink;
using strata_test::kNet;
using strata_test::kTransport;

TEST(LayerType, EqualityIsById) {
  constexpr LayerType renamed{101, "SomethingElse"};
  EXPECT_EQ(kLink, renamed);
  EXPECT_NE(kLink, kNet);
  EXPECT_EQ(LayerTypes::DecodeFailure.name, "DecodeFailure");
}

TEST(LayerType, IdZeroIsReservedForTheEngine) {
  EXPECT_EQ(LayerTypes::DecodeFailure.id, kReservedLayerTypeId);
  EXPECT_EQ(LayerType{}, LayerTypes::DecodeFailure);
  for (const LayerType& t : {kLink, kNet, kTransport, kApp}) {
    EXPECT_NE(t.id, kReservedLayerTypeId);
    EXPECT_NE(t, LayerTypes::DecodeFailure);
  }
}

TEST(LayerClassSet, ContainsOnlyMembers) {
  const LayerClassSet ip{kNet, kTransport};
  EXPECT_TRUE(ip.contains(kNet));
  EXPECT_TRUE(ip.contains(kTransport));
  EXPECT_FALSE(ip.contains(kLink));
  EXPECT_EQ(ip.types().size(), 2u);

  const LayerClassSet empty{std::vector<LayerType>{}};
  EXPECT_FALSE(empty.contains(kLink));
}

TEST(BaseLayer, SplitSeparatesHeaderAndPayload) {
  const std::vector<std::uint8_t> buf{1, 2, 3, 4, 5};
  const Bytes data{buf.data(), buf.size()};

  const BaseLayer l = BaseLayer::split(kLink, data, 2);
  ASSERT_EQ(l.contents().size(), 2u);
  ASSERT_EQ(l.payload().size(), 3u);
  EXPECT_EQ(l.contents().data(), buf.data());
  EXPECT_EQ(l.payload().data(), buf.data() + 2);
  EXPECT_EQ(l.layer_type(), kLink);
  EXPECT_EQ(l.to_string(), "FakeLink {contents=2 bytes, payload=3 bytes}");

  const BaseLayer all = BaseLayer::split(kApp, data, data.size());
  EXPECT_TRUE(all.payload().empty());
}

TEST(BaseLayer, SplitRejectsHeaderLongerThanInput) {
  const std::vector<std::uint8_t> buf{1, 2, 3, 4};
  const Bytes data{buf.data(), buf.size()};
  EXPECT_THROW((void)BaseLayer::split(kLink, data, 8), std::out_of_range);
  EXPECT_THROW((void)BaseLayer::split(kLink, Bytes{}, 1), std::out_of_range);
  EXPECT_NO_THROW((void)BaseLayer::split(kLink, Bytes{}, 0));
}

TEST(DecodeFailure, CarriesErrorAndRemainder) {
  const std::vector<std::uint8_t> rest{9, 9, 9};
  const DecodeFailure f{DecodeError{DecodeErrc::Truncated, "short buffer"},
                        Bytes{rest.data(), rest.size()}};

  EXPECT_EQ(f.layer_type(), LayerTypes::DecodeFailure);
  EXPECT_EQ(f.contents().size(), 3u);
  EXPECT_TRUE(f.payload().empty());
  EXPECT_EQ(f.error().code, DecodeErrc::Truncated);
  EXPECT_EQ(f.to_string(), "DecodeFailure {Truncated: short buffer, undecoded=3 bytes}");

  const ErrorLayer* as_error = &f;
  EXPECT_EQ(as_error->error().message, "short buffer");
}

TEST(DecodeError, WhatFallsBackToCodeName) {
  EXPECT_EQ((DecodeError{DecodeErrc::Malformed, "bad checksum"}).what(), "bad checksum");
  EXPECT_EQ((DecodeError{DecodeErrc::Malformed, ""}).what(), "Malformed");

  const DecodeResult r = decode_error(DecodeErrc::Unsupported, "vlan");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DecodeErrc::Unsupported);
}

TEST(Names, RolesAndCodes) {
  EXPECT_EQ(to_string(Role::Link), "Link");
  EXPECT_EQ(to_string(Role::Application), "Application");
  EXPECT_EQ(to_string(Role::Error), "Error");
  EXPECT_EQ(to_string(DecodeErrc::InvalidDecoder), "InvalidDecoder");
  EXPECT_EQ(to_string(DecodeErrc::NoLayerYet), "NoLayerYet");
  EXPECT_EQ(to_string(DecodeErrc::DecoderFault), "DecoderFault");
}

namespace {

/// Builder that only records what a decoder does to it.
class RecordingBuilder final : public PacketBuilder {
public:
  const Layer& append_layer(std::unique_ptr<Layer> layer) override {
    layers.push_back(std::move(layer));
    return *layers.back();
  }
  void claim_role(Role role, const Layer&) override { claims.push_back(role); }
  DecodeResult request_next(const Decoder* next) override {
    requested.push_back(next);
    return {};
  }

  std::vector<std::unique_ptr<Layer>> layers;
  std::vector<Role>                   claims;
  std::vector<const Decoder*>         requested;
};

} // namespace

TEST(DecodeFunc, ForwardsToCallable) {
  const DecodeFunc dec{[](Bytes d, PacketBuilder& b) -> DecodeResult {
    const auto& l = b.append_layer(std::make_unique<BaseLayer>(BaseLayer::split(kLink, d, 1)));
    b.claim_role(Role::Link, l);
    return {};
  }};
  const std::vector<std::uint8_t> buf{7, 8};
  RecordingBuilder b;

  ASSERT_TRUE(dec.decode(Bytes{buf.data(), buf.size()}, b).has_value());
  ASSERT_EQ(b.layers.size(), 1u);
  EXPECT_EQ(b.layers[0]->payload().size(), 1u);
  ASSERT_EQ(b.claims.size(), 1u);
  EXPECT_EQ(b.claims[0], Role::Link);
  EXPECT_TRUE(b.requested.empty());
}

TEST(DecodeFunc, EmptyTargetIsInvalidDecoder) {
  const DecodeFunc dec{DecodeFunc::Fn{}};
  RecordingBuilder b;
  const auto r = dec.decode(Bytes{}, b);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, DecodeErrc::InvalidDecoder);
}

TEST(HeaderDecoder, DrivesBuilderInOrder) {
  strata_test::FakeStack stack;
  const auto frame = strata_test::sample_frame();
  RecordingBuilder b;

  ASSERT_TRUE(stack.link.decode(Bytes{frame.data(), frame.size()}, b).has_value());
  ASSERT_EQ(b.requested.size(), 1u);
  EXPECT_EQ(b.requested[0], &stack.net);

  RecordingBuilder shortb;
  const std::vector<std::uint8_t> one{1};
  const auto r = stack.link.decode(Bytes{one.data(), one.size()}, shortb);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().message, "short buffer");
  EXPECT_TRUE(shortb.layers.empty());
}
