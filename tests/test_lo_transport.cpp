#include <gtest/gtest.h>

#include "FakeMixer.h"
#include "MixerControl/LoOscTransport.h"
#include "MixerControl/MixerExceptions.h"
#include "MixerControl/RequestCorrelator.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

extern "C" {
#include <lo/lo.h>
}

using namespace MixerControl;
using namespace std::chrono_literals;

namespace {

// Minimal mixer on the loopback interface: answers /xinfo and echoes
// argument-less queries of /ch/NN/mix/fader with 0.5
class LoopbackMixer {
public:
    LoopbackMixer() {
        m_server = lo_server_thread_new(nullptr, nullptr);
        lo_server_thread_add_method(m_server, nullptr, nullptr, &LoopbackMixer::onMessage, this);
        lo_server_thread_start(m_server);
    }

    ~LoopbackMixer() {
        lo_server_thread_stop(m_server);
        lo_server_thread_free(m_server);
    }

    int port() const { return lo_server_thread_get_port(m_server); }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_received;
    }

private:
    static int onMessage(const char *path, const char *types, lo_arg **argv, int argc, lo_message msg,
                         void *user_data) {
        (void)types;
        (void)argv;
        auto *self = static_cast<LoopbackMixer *>(user_data);
        {
            std::lock_guard<std::mutex> lock(self->m_mutex);
            self->m_received.push_back(path);
        }

        lo_address source = lo_message_get_source(msg);
        lo_server server = lo_server_thread_get_server(self->m_server);
        std::string address(path);

        if (address == "/xinfo") {
            lo_send_from(source, server, LO_TT_IMMEDIATE, "/xinfo", "ssss", "127.0.0.1", "XR18-LOOP", "XR18",
                         "1.17");
        } else if (argc == 0 && address.size() > 10 && address.compare(address.size() - 10, 10, "/mix/fader") == 0) {
            lo_send_from(source, server, LO_TT_IMMEDIATE, path, "f", 0.5f);
        }
        return 0;
    }

    lo_server_thread m_server = nullptr;
    std::mutex m_mutex;
    std::vector<std::string> m_received;
};

}  // namespace

TEST(LoOscTransport, BindsEphemeralLocalPort) {
    LoOscTransport transport("127.0.0.1", 10024);
    EXPECT_GT(transport.localPort(), 0);
    EXPECT_EQ(transport.remoteDescription(), "127.0.0.1:10024");
}

TEST(LoOscTransport, MessagesReachTheMixer) {
    LoopbackMixer mixer;
    LoOscTransport transport("127.0.0.1", mixer.port());

    transport.send("/ch/01/mix/fader", {0.75f});
    transport.send("/ch/01/config/name", {std::string("Kick")});
    transport.send("/ch/01/mix/on", {0});

    EXPECT_TRUE(waitUntil([&] { return mixer.received().size() == 3; }));
    auto received = mixer.received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0], "/ch/01/mix/fader");
    EXPECT_EQ(received[2], "/ch/01/mix/on");
}

TEST(LoOscTransport, UnsupportedArgumentTypeIsRejected) {
    LoOscTransport transport("127.0.0.1", 10024);
    EXPECT_THROW(transport.send("/ch/01/mix/fader", {std::vector<int>{1, 2}}), TypeMismatchException);
}

TEST(LoOscTransport, DecodedArgumentsKeepTheirPositions) {
    lo_arg first;
    first.i = 7;
    lo_arg last;
    last.f = 0.5f;

    // A missing payload leaves an empty slot instead of shifting later arguments
    lo_arg *argv[] = {&first, nullptr, &last};
    OscArgs args = decodeLoArguments("iif", argv, 3);
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(std::any_cast<int>(args[0]), 7);
    EXPECT_FALSE(args[1].has_value());
    EXPECT_FLOAT_EQ(std::any_cast<float>(args[2]), 0.5f);

    // Flags decode without a payload
    lo_arg *flags[] = {&first, nullptr, &last};
    OscArgs withFlag = decodeLoArguments("iTf", flags, 3);
    ASSERT_EQ(withFlag.size(), 3u);
    EXPECT_TRUE(std::any_cast<bool>(withFlag[1]));
    EXPECT_FLOAT_EQ(std::any_cast<float>(withFlag[2]), 0.5f);

    // Types we do not decode still occupy their slot
    lo_arg *unknown[] = {&first, &first, &last};
    OscArgs withBlob = decodeLoArguments("ibf", unknown, 3);
    ASSERT_EQ(withBlob.size(), 3u);
    EXPECT_FALSE(withBlob[1].has_value());
    EXPECT_FLOAT_EQ(std::any_cast<float>(withBlob[2]), 0.5f);
}

TEST(LoOscTransport, RepliesComeBackToTheSendingSocket) {
    LoopbackMixer mixer;
    LoOscTransport transport("127.0.0.1", mixer.port());
    RequestCorrelator correlator(transport);
    transport.setInboundHandler([&correlator](const std::string &address, const OscArgs &args) {
        correlator.dispatch(address, args);
    });

    OscArgs info = correlator.queryArguments("/xinfo", 1000ms);
    ASSERT_EQ(info.size(), 4u);
    EXPECT_EQ(std::any_cast<std::string>(info[1]), "XR18-LOOP");

    std::any fader = correlator.query("/ch/07/mix/fader", 1000ms);
    EXPECT_FLOAT_EQ(std::any_cast<float>(fader), 0.5f);

    transport.setInboundHandler(nullptr);
}

TEST(LoOscTransport, InboundHandlerSeesUnsolicitedMessages) {
    LoOscTransport transport("127.0.0.1", 10024);
    std::atomic<int> count{0};
    std::string lastAddress;
    std::mutex mutex;
    transport.setInboundHandler([&](const std::string &address, const OscArgs &args) {
        std::lock_guard<std::mutex> lock(mutex);
        lastAddress = address;
        if (!args.empty() && args[0].type() == typeid(int)) {
            count++;
        }
    });

    lo_address self = lo_address_new("127.0.0.1", std::to_string(transport.localPort()).c_str());
    lo_send(self, "/-stat/solosw/01", "i", 1);
    lo_address_free(self);

    EXPECT_TRUE(waitUntil([&] { return count.load() == 1; }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(lastAddress, "/-stat/solosw/01");
    }
    transport.setInboundHandler(nullptr);
}
