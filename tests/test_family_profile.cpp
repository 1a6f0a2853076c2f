#include <gtest/gtest.h>

#include "MixerControl/AddressTranslator.h"
#include "MixerControl/FamilyProfile.h"
#include "MixerControl/MixerExceptions.h"

#include <limits>
#include <string>

using namespace MixerControl;

namespace {

std::string addressOf(const AddressTranslator &tr, Control control, const IndexMap &indices) {
    auto address = tr.queryAddress(control, indices);
    return address ? *address : std::string("<unsupported>");
}

}  // namespace

TEST(FamilyProfile, Limits) {
    const FamilyProfile &x32 = FamilyProfile::x32();
    EXPECT_EQ(x32.limit(IndexKind::Channel), 32);
    EXPECT_EQ(x32.limit(IndexKind::Bus), 16);
    EXPECT_EQ(x32.limit(IndexKind::Effect), 8);
    EXPECT_EQ(x32.limit(IndexKind::Scene), 100);
    EXPECT_EQ(x32.limit(IndexKind::Aux), 8);
    EXPECT_EQ(x32.limit(IndexKind::Matrix), 6);

    const FamilyProfile &xair = FamilyProfile::xair();
    EXPECT_EQ(xair.limit(IndexKind::Channel), 16);
    EXPECT_EQ(xair.limit(IndexKind::Bus), 6);
    EXPECT_EQ(xair.limit(IndexKind::Effect), 4);
    EXPECT_EQ(xair.limit(IndexKind::Scene), 64);
    EXPECT_EQ(xair.limit(IndexKind::Aux), 0);
    EXPECT_EQ(xair.limit(IndexKind::Matrix), 0);
}

TEST(FamilyProfile, IdentificationAndKeepaliveAddresses) {
    EXPECT_EQ(FamilyProfile::x32().fixedAddress(Control::Info), "/info");
    EXPECT_EQ(FamilyProfile::xair().fixedAddress(Control::Info), "/xinfo");
    EXPECT_EQ(FamilyProfile::x32().fixedAddress(Control::Keepalive), "/xremote");
    EXPECT_EQ(FamilyProfile::xair().fixedAddress(Control::Keepalive), "/xremote");

    auto order = FamilyProfile::detectionOrder();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0]->family(), MixerFamily::XAir);
    EXPECT_EQ(order[1]->family(), MixerFamily::X32);
}

TEST(FamilyProfile, ForFamilyRequiresDetection) {
    EXPECT_EQ(&FamilyProfile::forFamily(MixerFamily::X32), &FamilyProfile::x32());
    EXPECT_EQ(&FamilyProfile::forFamily(MixerFamily::XAir), &FamilyProfile::xair());
    EXPECT_THROW(FamilyProfile::forFamily(MixerFamily::Unknown), NotConnectedException);
}

TEST(FamilyProfile, IndexPaddingAndBase) {
    const FamilyProfile &x32 = FamilyProfile::x32();
    EXPECT_EQ(x32.formatIndex(IndexKind::Channel, 1), "01");
    EXPECT_EQ(x32.formatIndex(IndexKind::Channel, 32), "32");
    EXPECT_EQ(x32.formatIndex(IndexKind::Bus, 3), "03");
    EXPECT_EQ(x32.formatIndex(IndexKind::Scene, 1), "000");
    EXPECT_EQ(x32.formatIndex(IndexKind::Scene, 100), "099");
    EXPECT_EQ(x32.wireIndex(IndexKind::Scene, 5), 4);

    const FamilyProfile &xair = FamilyProfile::xair();
    EXPECT_EQ(xair.formatIndex(IndexKind::Channel, 7), "07");
    EXPECT_EQ(xair.formatIndex(IndexKind::Bus, 3), "3");
    EXPECT_EQ(xair.formatIndex(IndexKind::Effect, 2), "2");
    EXPECT_EQ(xair.formatIndex(IndexKind::SendBus, 3), "03");
    EXPECT_EQ(xair.wireIndex(IndexKind::Scene, 5), 5);

    // FX 1-4 feed send slots 07-10
    EXPECT_EQ(xair.formatIndex(IndexKind::FxSend, 1), "07");
    EXPECT_EQ(xair.formatIndex(IndexKind::FxSend, 4), "10");
}

TEST(FamilyProfile, OutOfRangeIndexThrows) {
    const FamilyProfile &xair = FamilyProfile::xair();
    EXPECT_THROW(xair.wireIndex(IndexKind::Channel, 0), InvalidIndexException);
    EXPECT_THROW(xair.wireIndex(IndexKind::Channel, 17), InvalidIndexException);
    EXPECT_THROW(xair.wireIndex(IndexKind::Scene, 65), InvalidIndexException);
    EXPECT_THROW(xair.wireIndex(IndexKind::Aux, 1), InvalidIndexException);
    EXPECT_NO_THROW(FamilyProfile::x32().wireIndex(IndexKind::Channel, 17));

    try {
        xair.wireIndex(IndexKind::Bus, 7);
        FAIL() << "expected InvalidIndexException";
    } catch (const InvalidIndexException &e) {
        EXPECT_EQ(e.code(), MixerException::ErrorCode::InvalidIndex);
        EXPECT_NE(std::string(e.what()).find("1-6"), std::string::npos);
    }
}

TEST(FamilyProfile, ExpandRejectsMissingIndex) {
    EXPECT_THROW(FamilyProfile::x32().expand("/ch/{ch}/mix/fader", {}), MixerException);
    EXPECT_THROW(FamilyProfile::x32().expand("/ch/{nope}/mix/fader", {{IndexKind::Channel, 1}}), MixerException);
}

TEST(AddressTranslator, FamilySpecificAddresses) {
    AddressTranslator x32(FamilyProfile::x32());
    AddressTranslator xair(FamilyProfile::xair());

    EXPECT_EQ(addressOf(x32, Control::ChannelFader, {{IndexKind::Channel, 5}}), "/ch/05/mix/fader");
    EXPECT_EQ(addressOf(xair, Control::ChannelFader, {{IndexKind::Channel, 5}}), "/ch/05/mix/fader");

    EXPECT_EQ(addressOf(x32, Control::MainFader, {}), "/main/st/mix/fader");
    EXPECT_EQ(addressOf(xair, Control::MainFader, {}), "/lr/mix/fader");

    EXPECT_EQ(addressOf(x32, Control::BusFader, {{IndexKind::Bus, 2}}), "/bus/02/mix/fader");
    EXPECT_EQ(addressOf(xair, Control::BusFader, {{IndexKind::Bus, 2}}), "/bus/2/mix/fader");

    EXPECT_EQ(addressOf(x32, Control::FxOn, {{IndexKind::Effect, 3}}), "/fx/3/on");
    EXPECT_EQ(addressOf(xair, Control::FxOn, {{IndexKind::Effect, 3}}), "/fx/3/insert");

    EXPECT_EQ(addressOf(x32, Control::ChannelSource, {{IndexKind::Channel, 1}}), "/ch/01/config/source");
    EXPECT_EQ(addressOf(xair, Control::ChannelSource, {{IndexKind::Channel, 1}}), "/ch/01/config/insrc");

    EXPECT_EQ(addressOf(x32, Control::SendLevel, {{IndexKind::Channel, 1}, {IndexKind::SendBus, 4}}),
              "/ch/01/mix/04/level");
    EXPECT_EQ(addressOf(xair, Control::FxSendLevel, {{IndexKind::Channel, 2}, {IndexKind::FxSend, 1}}),
              "/ch/02/mix/07/level");

    EXPECT_EQ(addressOf(x32, Control::EqGain, {{IndexKind::Channel, 3}, {IndexKind::Band, 2}}), "/ch/03/eq/2/g");
    EXPECT_EQ(addressOf(xair, Control::FxParam, {{IndexKind::Effect, 1}, {IndexKind::FxParam, 5}}), "/fx/1/par/05");

    EXPECT_EQ(addressOf(x32, Control::SceneName, {{IndexKind::Scene, 1}}), "/-snap/000/name");
    EXPECT_EQ(addressOf(xair, Control::SceneActiveName, {}), "/-snap/name");
    EXPECT_EQ(addressOf(x32, Control::SceneActiveIndex, {}), "/-show/prepos/current");
    EXPECT_EQ(addressOf(xair, Control::SceneActiveIndex, {}), "/-snap/index");
}

TEST(AddressTranslator, UnsupportedControlsResolveToNothing) {
    AddressTranslator x32(FamilyProfile::x32());
    AddressTranslator xair(FamilyProfile::xair());

    EXPECT_FALSE(xair.supports(Control::AuxFader));
    EXPECT_FALSE(xair.supports(Control::MatrixMute));
    EXPECT_FALSE(x32.supports(Control::FxSendLevel));
    EXPECT_FALSE(x32.supports(Control::FxMix));

    // Support is decided before the index is validated: the X-Air aux limit is 0
    EXPECT_FALSE(xair.encodeSet(Control::AuxFader, {{IndexKind::Aux, 1}}, 0.5f).has_value());
    EXPECT_FALSE(xair.queryAddress(Control::AuxFader, {{IndexKind::Aux, 1}}).has_value());
    EXPECT_FALSE(x32.encodeSet(Control::FxSendLevel, {{IndexKind::Channel, 1}, {IndexKind::FxSend, 9}}, 0.5f)
                     .has_value());

    EXPECT_FLOAT_EQ(std::any_cast<float>(xair.placeholder(Control::AuxFader)), 0.0f);
    EXPECT_FALSE(std::any_cast<bool>(xair.placeholder(Control::AuxMute)));
    EXPECT_EQ(std::any_cast<std::string>(xair.placeholder(Control::SceneName)), "");
}

TEST(AddressTranslator, EncodeSetAppliesFamilyEncoding) {
    AddressTranslator x32(FamilyProfile::x32());
    AddressTranslator xair(FamilyProfile::xair());

    auto pan = xair.encodeSet(Control::ChannelPan, {{IndexKind::Channel, 1}}, 0.0f);
    ASSERT_TRUE(pan.has_value());
    EXPECT_EQ(pan->address, "/ch/01/mix/pan");
    ASSERT_EQ(pan->args.size(), 1u);
    EXPECT_FLOAT_EQ(std::any_cast<float>(pan->args[0]), 0.5f);

    auto mute = x32.encodeSet(Control::MainMute, {}, true);
    ASSERT_TRUE(mute.has_value());
    EXPECT_EQ(mute->address, "/main/st/mix/on");
    EXPECT_EQ(std::any_cast<int>(mute->args[0]), 0);

    // Only the X-Air low cut is nudged
    auto xairCut = xair.encodeSet(Control::LowCutFrequency, {{IndexKind::Channel, 1}}, 100.0f);
    auto x32Cut = x32.encodeSet(Control::LowCutFrequency, {{IndexKind::Channel, 1}}, 100.0f);
    ASSERT_TRUE(xairCut && x32Cut);
    EXPECT_NEAR(std::any_cast<float>(xairCut->args[0]), ValueCodec::encodeLowCut(101.0f, false), 1e-6);
    EXPECT_NEAR(std::any_cast<float>(x32Cut->args[0]), ValueCodec::encodeLowCut(100.0f, false), 1e-6);
}

TEST(AddressTranslator, IntegerControlsAreClampedToTheirRange) {
    AddressTranslator x32(FamilyProfile::x32());
    AddressTranslator xair(FamilyProfile::xair());

    auto xairSource = xair.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}}, 40);
    ASSERT_TRUE(xairSource.has_value());
    EXPECT_EQ(std::any_cast<int>(xairSource->args[0]), 15);

    auto x32Source = x32.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}}, 40);
    ASSERT_TRUE(x32Source.has_value());
    EXPECT_EQ(std::any_cast<int>(x32Source->args[0]), 40);

    auto color = x32.encodeSet(Control::ChannelColor, {{IndexKind::Channel, 1}}, -3);
    ASSERT_TRUE(color.has_value());
    EXPECT_EQ(std::any_cast<int>(color->args[0]), 0);
}

TEST(AddressTranslator, InvalidIndexOnSupportedControl) {
    AddressTranslator xair(FamilyProfile::xair());
    EXPECT_THROW(xair.encodeSet(Control::ChannelFader, {{IndexKind::Channel, 17}}, 0.5f), InvalidIndexException);
    EXPECT_THROW(xair.queryAddress(Control::BusFader, {{IndexKind::Bus, 0}}), InvalidIndexException);
}

TEST(FamilyProfile, X32BusesStartAtOne) {
    const FamilyProfile &x32 = FamilyProfile::x32();
    EXPECT_EQ(x32.wireIndex(IndexKind::Bus, 1), 1);
    EXPECT_EQ(x32.expand("/bus/{bus}/mix/fader", {{IndexKind::Bus, 1}}), "/bus/01/mix/fader");
    EXPECT_EQ(x32.expand("/bus/{bus}/mix/fader", {{IndexKind::Bus, 16}}), "/bus/16/mix/fader");
    EXPECT_THROW(x32.wireIndex(IndexKind::Bus, 0), InvalidIndexException);
    EXPECT_THROW(x32.wireIndex(IndexKind::Bus, 17), InvalidIndexException);

    AddressTranslator tr(x32);
    EXPECT_EQ(addressOf(tr, Control::SendLevel, {{IndexKind::Channel, 1}, {IndexKind::SendBus, 1}}),
              "/ch/01/mix/01/level");

    // Scenes, unlike buses, are zero-based on the wire
    EXPECT_EQ(x32.formatIndex(IndexKind::Scene, 1), "000");
}

TEST(AddressTranslator, HugeIntegersClampToUpperBound) {
    AddressTranslator xair(FamilyProfile::xair());
    AddressTranslator x32(FamilyProfile::x32());
    const int kMax = std::numeric_limits<int>::max();
    const int kMin = std::numeric_limits<int>::min();

    auto high = xair.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}}, kMax);
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(std::any_cast<int>(high->args.at(0)), 15);

    auto low = xair.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}}, kMin);
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(std::any_cast<int>(low->args.at(0)), 0);

    auto viaFloat = x32.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}}, static_cast<float>(kMax));
    ASSERT_TRUE(viaFloat.has_value());
    EXPECT_EQ(std::any_cast<int>(viaFloat->args.at(0)), 64);
}

TEST(AddressTranslator, NonFiniteValuesAreRejected) {
    AddressTranslator xair(FamilyProfile::xair());
    EXPECT_THROW(xair.encodeSet(Control::ChannelFader, {{IndexKind::Channel, 1}},
                                std::numeric_limits<float>::quiet_NaN()),
                 InvalidParameterException);
    EXPECT_THROW(xair.encodeSet(Control::ChannelSource, {{IndexKind::Channel, 1}},
                                std::numeric_limits<float>::quiet_NaN()),
                 InvalidParameterException);
}
