#include "lumen/client/client.hpp"

#include "lumen/error.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lumen;
using namespace lumen::client;
using namespace lumen::protocol;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t kTarget = 0x0100d5d373d0ull;
const net::Endpoint kBulbAddress{0xC0A80114u, 56700};

struct SentDatagram {
    std::vector<uint8_t> bytes;
    net::Endpoint to;
    bool broadcast = false;
};

/// In-memory DatagramSocket. Inbound datagrams are injected by the test; every send
/// is recorded along with the broadcast mode in effect at the time.
class FakeSocket : public net::DatagramSocket {
  public:
    size_t send_to(std::span<const uint8_t> bytes, const net::Endpoint &to) override {
        std::lock_guard lock(mutex_);
        if (fail_sends_) {
            throw SocketError("network unreachable");
        }
        sent_.push_back({std::vector<uint8_t>(bytes.begin(), bytes.end()), to, broadcast_});
        cv_.notify_all();
        return short_writes_ ? bytes.size() - 1 : bytes.size();
    }

    std::optional<net::Datagram> recv_from(std::span<uint8_t> buffer) override {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, 10ms, [this] { return !inbound_.empty(); })) {
            return std::nullopt;
        }
        auto [bytes, from] = std::move(inbound_.front());
        inbound_.pop_front();
        const size_t n = std::min(bytes.size(), buffer.size());
        std::copy_n(bytes.begin(), n, buffer.begin());
        return net::Datagram{n, from};
    }

    void set_broadcast(bool enabled) override {
        std::lock_guard lock(mutex_);
        if (fail_broadcast_) {
            throw SocketError("permission denied");
        }
        broadcast_ = enabled;
        toggles_.push_back(enabled);
    }

    [[nodiscard]] bool broadcast() const override {
        std::lock_guard lock(mutex_);
        return broadcast_;
    }

    void inject(std::vector<uint8_t> bytes, const net::Endpoint &from) {
        std::lock_guard lock(mutex_);
        inbound_.emplace_back(std::move(bytes), from);
        cv_.notify_all();
    }

    void inject(const Message &message, const net::Endpoint &from) {
        inject(message.encode(), from);
    }

    bool wait_for_sends(size_t count, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return sent_.size() >= count; });
    }

    [[nodiscard]] std::vector<SentDatagram> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::vector<bool> toggles() const {
        std::lock_guard lock(mutex_);
        return toggles_;
    }

    void set_short_writes(bool v) { short_writes_ = v; }
    void set_fail_sends(bool v) { fail_sends_ = v; }
    void set_fail_broadcast(bool v) { fail_broadcast_ = v; }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::pair<std::vector<uint8_t>, net::Endpoint>> inbound_;
    std::vector<SentDatagram> sent_;
    std::vector<bool> toggles_;
    bool broadcast_ = false;
    std::atomic<bool> short_writes_{false};
    std::atomic<bool> fail_sends_{false};
    std::atomic<bool> fail_broadcast_{false};
};

ClientConfig fast_config() {
    ClientConfig config;
    config.read_timeout = 20ms;
    config.request_delay = 0ms;
    config.discover_interval = 50ms;
    return config;
}

template <typename Pred> bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

Message state_service(uint64_t target = kTarget) {
    return Message(device::StateService{Service::Udp, 56700}, false, target, 0);
}

void register_bulb(Client &client, FakeSocket &socket) {
    socket.inject(state_service(), kBulbAddress);
    ASSERT_TRUE(eventually([&] { return client.device(kTarget).has_value(); }));
}

} // namespace

TEST(Client, NullSocketIsRejected) {
    EXPECT_THROW(Client(std::shared_ptr<net::DatagramSocket>{}), BindError);
}

TEST(Client, SendMsgIncrementsSequence) {
    auto socket = std::make_shared<FakeSocket>();
    auto config = fast_config();
    config.source = 4242;
    Client client(socket, config);

    EXPECT_EQ(client.send_msg(kBulbAddress, device::GetLabel{}, false, kTarget), 0);
    EXPECT_EQ(client.send_msg(kBulbAddress, device::GetPower{}, true, kTarget), 1);

    const auto sent = socket->sent();
    ASSERT_EQ(sent.size(), 2u);
    const auto second = Message::decode(sent[1].bytes);
    EXPECT_EQ(second.header().sequence, 1);
    EXPECT_EQ(second.header().source, 4242u);
    EXPECT_EQ(second.header().target, kTarget);
    EXPECT_TRUE(second.header().ack_required);
    EXPECT_TRUE(second.payload().is<device::GetPower>());
    EXPECT_EQ(sent[1].to, kBulbAddress);
}

TEST(Client, ShortWriteRaisesSendError) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    socket->set_short_writes(true);

    EXPECT_THROW(client.send_msg(kBulbAddress, device::GetLabel{}, false, kTarget), SendError);
}

TEST(Client, TransportFailureRaisesSendError) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    socket->set_fail_sends(true);

    EXPECT_THROW(client.send_msg(kBulbAddress, device::GetLabel{}, false, kTarget), SendError);
}

TEST(Client, OverlongLabelRaisesEncodeError) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());

    EXPECT_THROW(client.send_msg(kBulbAddress, device::SetLabel{std::string(40, 'x')}, false,
                                 kTarget),
                 EncodeError);
    EXPECT_TRUE(socket->sent().empty());
}

TEST(Client, GetServicesBroadcastsAndRestoresMode) {
    auto socket = std::make_shared<FakeSocket>();
    auto config = fast_config();
    config.broadcast = net::Endpoint::parse("192.168.1.255");
    Client client(socket, config);

    client.get_services();

    const auto sent = socket->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(sent[0].broadcast);
    EXPECT_EQ(sent[0].to, config.broadcast);

    const auto msg = Message::decode(sent[0].bytes);
    EXPECT_TRUE(msg.payload().is<device::GetService>());
    EXPECT_TRUE(msg.header().tagged);
    EXPECT_EQ(msg.header().target, 0u);

    EXPECT_FALSE(socket->broadcast());
    EXPECT_EQ(socket->toggles(), (std::vector<bool>{true, false}));
}

TEST(Client, UnicastAfterBroadcastIsNotBroadcast) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());

    client.get_services();
    client.send_msg(kBulbAddress, device::GetLabel{}, false, kTarget);

    const auto sent = socket->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_FALSE(sent[1].broadcast);
}

TEST(Client, BroadcastFailureRaisesSendError) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    socket->set_fail_broadcast(true);

    EXPECT_THROW(client.get_services(), SendError);
    EXPECT_TRUE(socket->sent().empty());
}

TEST(Client, ListenRegistersAndUpdatesDevices) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.listen();

    register_bulb(client, *socket);
    EXPECT_EQ(client.device(kTarget)->endpoint, kBulbAddress);

    socket->inject(Message(device::StateLabel{"Kitchen"}, false, kTarget, 1), kBulbAddress);
    EXPECT_TRUE(eventually([&] { return client.device(kTarget)->label == "Kitchen"; }));
    EXPECT_EQ(client.devices().size(), 1u);
}

TEST(Client, UndecodableDatagramsAreSkipped) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.listen();

    socket->inject(std::vector<uint8_t>{0x01, 0x02, 0x03}, kBulbAddress);
    auto unknown = Message(device::GetLabel{}, false, kTarget, 0).encode();
    unknown[32] = 0x0f;
    unknown[33] = 0x27;
    socket->inject(std::move(unknown), kBulbAddress);

    register_bulb(client, *socket);
    EXPECT_EQ(client.devices().size(), 1u);
}

TEST(Client, MessageCallbackSeesEveryDecodedMessage) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());

    std::mutex mutex;
    std::vector<uint16_t> types;
    client.set_message_callback([&](const Message &message, const net::Endpoint &from) {
        EXPECT_EQ(from, kBulbAddress);
        std::lock_guard lock(mutex);
        types.push_back(message.header().type);
    });
    client.listen();

    socket->inject(state_service(), kBulbAddress);
    socket->inject(Message(device::StatePower{Power::Max}, false, kTarget, 2), kBulbAddress);

    EXPECT_TRUE(eventually([&] {
        std::lock_guard lock(mutex);
        return types.size() == 2;
    }));
    std::lock_guard lock(mutex);
    EXPECT_EQ(types, (std::vector<uint16_t>{3, 22}));
}

TEST(Client, ThrowingCallbackDoesNotStopReceiving) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.set_message_callback(
        [](const Message &, const net::Endpoint &) { throw std::runtime_error("boom"); });
    client.listen();

    register_bulb(client, *socket);
    socket->inject(Message(device::StateLabel{"Hall"}, false, kTarget, 1), kBulbAddress);
    EXPECT_TRUE(eventually([&] { return client.device(kTarget)->label == "Hall"; }));
}

TEST(Client, DiscoverRequestsSelectedStateFromKnownDevices) {
    auto socket = std::make_shared<FakeSocket>();
    auto config = fast_config();
    config.discover_interval = 10s;
    Client client(socket, config);
    client.listen();
    register_bulb(client, *socket);

    client.discover(10s, DiscoverOption::Label | DiscoverOption::Group);
    ASSERT_TRUE(socket->wait_for_sends(3));

    const auto sent = socket->sent();
    const auto first = Message::decode(sent[0].bytes);
    EXPECT_TRUE(first.payload().is<device::GetService>());
    EXPECT_TRUE(sent[0].broadcast);

    const auto second = Message::decode(sent[1].bytes);
    EXPECT_TRUE(second.payload().is<device::GetLabel>());
    EXPECT_EQ(second.header().target, kTarget);
    EXPECT_EQ(sent[1].to, kBulbAddress);
    EXPECT_FALSE(sent[1].broadcast);

    const auto third = Message::decode(sent[2].bytes);
    EXPECT_TRUE(third.payload().is<device::GetGroup>());

    client.close();
    EXPECT_EQ(socket->sent().size(), 3u);
}

TEST(Client, DiscoverWithNoOptionsOnlyBroadcasts) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.listen();
    register_bulb(client, *socket);

    client.discover(20ms, DiscoverOption::None);
    ASSERT_TRUE(socket->wait_for_sends(2));
    client.close();

    for (const auto &datagram : socket->sent()) {
        EXPECT_TRUE(Message::decode(datagram.bytes).payload().is<device::GetService>());
    }
}

TEST(Client, DiscoverSurvivesSendFailures) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    socket->set_fail_broadcast(true);

    client.discover(10ms, DiscoverOption::All);
    std::this_thread::sleep_for(50ms);
    socket->set_fail_broadcast(false);

    EXPECT_TRUE(socket->wait_for_sends(1));
    client.close();
}

TEST(Client, SendToDeviceUsesDirectoryEndpoint) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());

    EXPECT_THROW(client.send_to_device(kTarget, light::GetPower{}), SendError);

    client.listen();
    register_bulb(client, *socket);
    client.send_to_device(kTarget, light::SetPower{Power::Max, 250});

    const auto sent = socket->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].to, kBulbAddress);
    const auto msg = Message::decode(sent[0].bytes);
    EXPECT_EQ(msg.target(), kTarget);
    EXPECT_EQ(msg.payload(), Payload(light::SetPower{Power::Max, 250}));
}

TEST(Client, CloseStopsThreadsPromptly) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.listen();
    client.discover(10s, DiscoverOption::All);

    const auto start = std::chrono::steady_clock::now();
    client.close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(client.is_closed());

    client.close();
    EXPECT_TRUE(client.is_closed());
}

TEST(Client, ListenAfterCloseIsIgnored) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    client.close();
    client.listen();

    socket->inject(state_service(), kBulbAddress);
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(client.devices().empty());
}

TEST(Client, DestructorJoinsThreads) {
    auto socket = std::make_shared<FakeSocket>();
    {
        Client client(socket, fast_config());
        client.listen();
        client.discover(5s, DiscoverOption::None);
        ASSERT_TRUE(socket->wait_for_sends(1));
    }
    EXPECT_EQ(socket.use_count(), 1);
}

TEST(Client, CloseFromCallbackThenDestroyJoinsReceiveThread) {
    auto socket = std::make_shared<FakeSocket>();
    auto client = std::make_unique<Client>(socket, fast_config());
    Client *raw = client.get();

    std::atomic<bool> closed_in_callback{false};
    std::atomic<bool> callback_returned{false};
    client->set_message_callback([&](const Message &, const net::Endpoint &) {
        raw->close();
        closed_in_callback = true;
        std::this_thread::sleep_for(50ms);
        callback_returned = true;
    });
    client->listen();

    socket->inject(state_service(), kBulbAddress);
    ASSERT_TRUE(eventually([&] { return closed_in_callback.load(); }));
    EXPECT_TRUE(client->is_closed());

    // Returns only once the receive thread has left the callback and its loop.
    client.reset();
    EXPECT_TRUE(callback_returned);
    EXPECT_EQ(socket.use_count(), 1);
}

TEST(Client, CloseFromCallbackStillJoinsOtherThreads) {
    auto socket = std::make_shared<FakeSocket>();
    Client client(socket, fast_config());
    std::atomic<bool> closed_in_callback{false};
    client.set_message_callback([&](const Message &, const net::Endpoint &) {
        client.close();
        closed_in_callback = true;
    });
    client.listen();
    client.discover(10s, DiscoverOption::None);
    ASSERT_TRUE(socket->wait_for_sends(1));

    socket->inject(state_service(), kBulbAddress);
    ASSERT_TRUE(eventually([&] { return closed_in_callback.load(); }));
    client.close();
    EXPECT_TRUE(client.is_closed());
}

TEST(DiscoverRequest, EachFlagMapsToItsGetRequest) {
    EXPECT_EQ(discover_request(DiscoverOption::Label), Payload(device::GetLabel{}));
    EXPECT_EQ(discover_request(DiscoverOption::Power), Payload(device::GetPower{}));
    EXPECT_EQ(discover_request(DiscoverOption::Location), Payload(device::GetLocation{}));
    EXPECT_EQ(discover_request(DiscoverOption::Group), Payload(device::GetGroup{}));
    EXPECT_EQ(discover_request(DiscoverOption::HostInfo), Payload(device::GetHostInfo{}));
    EXPECT_EQ(discover_request(DiscoverOption::HostFirmware), Payload(device::GetHostFirmware{}));
    EXPECT_EQ(discover_request(DiscoverOption::WifiFirmware), Payload(device::GetWifiFirmware{}));
}

TEST(DiscoverRequest, CombinedOrEmptyOptionsThrow) {
    EXPECT_THROW(discover_request(DiscoverOption::None), std::invalid_argument);
    EXPECT_THROW(discover_request(DiscoverOption::All), std::invalid_argument);
    EXPECT_THROW(discover_request(DiscoverOption::Label | DiscoverOption::Power),
                 std::invalid_argument);
}
