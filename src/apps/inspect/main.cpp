// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief fdpinspect: decode packet files and print their fields.
///
///     fdpinspect <packet-file>...
///     fdpinspect --sample <out-file> [session-id-hex]
///
/// The second form writes an encoded Ping packet with an empty payload,
/// handy for feeding a transport under test.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/PacketCodec.hpp>
#include <fdp/core/Log.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace fdp;

constexpr core::usize kPayloadPreview = 32;

void printPacket(std::string_view path, const protocol::Packet& packet)
{
    std::printf("%.*s\n", static_cast<int>(path.size()), path.data());
    std::printf("  version    %u\n", static_cast<unsigned>(packet.version));
    std::printf("  session    %s\n", packet.sessionId.toString().c_str());

    const auto intentName   = protocol::toString(packet.intent);
    const auto categoryName = protocol::toString(protocol::categoryOf(packet.intent));
    std::printf("  intent     %.*s (0x%02x, %.*s)\n",
                static_cast<int>(intentName.size()), intentName.data(),
                static_cast<unsigned>(protocol::toCode(packet.intent)),
                static_cast<int>(categoryName.size()), categoryName.data());

    std::printf("  priority   %u\n", static_cast<unsigned>(packet.priority.value()));

    const auto comp = protocol::toString(packet.flags.compression());
    const auto enc  = protocol::toString(packet.flags.encryption());
    std::printf("  flags      0x%02x compression=%.*s encryption=%.*s fragmented=%d ack=%d\n",
                static_cast<unsigned>(packet.flags.raw()),
                static_cast<int>(comp.size()), comp.data(),
                static_cast<int>(enc.size()), enc.data(),
                packet.flags.isFragmented() ? 1 : 0,
                packet.flags.ackRequired() ? 1 : 0);

    std::printf("  sequence   %u\n", packet.sequence);
    std::printf("  timestamp  %llu\n", static_cast<unsigned long long>(packet.timestamp));
    std::printf("  payload    %zu bytes:", packet.payload.size());
    for (core::usize i = 0; i < packet.payload.size() && i < kPayloadPreview; ++i)
        std::printf(" %02x", static_cast<unsigned>(packet.payload[i]));
    if (packet.payload.size() > kPayloadPreview)
        std::printf(" ...");
    std::printf("\n  hash      ");
    for (auto b : packet.hash)
        std::printf("%02x", static_cast<unsigned>(b));
    std::printf("\n");
}

int inspect(const char* path, const protocol::PacketCodec& codec)
{
    std::ifstream in{path, std::ios::binary};
    if (!in)
    {
        core::Log::error("inspect", std::string{"cannot open "} + path);
        return 1;
    }

    const std::vector<core::u8> bytes(std::istreambuf_iterator<char>{in},
                                      std::istreambuf_iterator<char>{});
    auto packet = codec.decode(bytes);
    if (!packet)
    {
        std::printf("%s: rejected: %s\n", path, packet.error().format().c_str());
        return 2;
    }

    printPacket(path, *packet);
    return 0;
}

int writeSample(const char* path, const char* sessionHex)
{
    protocol::SessionId session{};
    if (sessionHex)
    {
        auto parsed = protocol::SessionId::fromHex(sessionHex);
        if (!parsed)
        {
            core::Log::error("inspect", parsed.error().format());
            return 1;
        }
        session = *parsed;
    }
    else
    {
        auto generated = protocol::SessionId::generate();
        if (!generated)
        {
            core::Log::error("inspect", generated.error().format());
            return 1;
        }
        session = *generated;
    }

    auto packet = protocol::Packet::create(session, protocol::Intent::Ping, {});
    if (!packet)
    {
        core::Log::error("inspect", packet.error().format());
        return 1;
    }

    const auto bytes = protocol::encode(*packet);
    std::ofstream out{path, std::ios::binary};
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out)
    {
        core::Log::error("inspect", std::string{"cannot write "} + path);
        return 1;
    }

    core::Log::info("inspect", "wrote " + std::to_string(bytes.size()) + " bytes, session " +
                               session.toString());
    return 0;
}

void usage()
{
    std::fprintf(stderr,
                 "usage: fdpinspect <packet-file>...\n"
                 "       fdpinspect --sample <out-file> [session-id-hex]\n");
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        usage();
        return 1;
    }

    const std::string_view first{argv[1]};
    if (first == "--sample")
    {
        if (argc < 3 || argc > 4)
        {
            usage();
            return 1;
        }
        return writeSample(argv[2], argc == 4 ? argv[3] : nullptr);
    }

    const auto config = fdp::protocol::ProtocolConfig::Builder{}
        .logRejections(false)
        .build();
    const fdp::protocol::PacketCodec codec{config};

    int status = 0;
    for (int i = 1; i < argc; ++i)
    {
        const int rc = inspect(argv[i], codec);
        if (rc != 0)
            status = rc;
    }
    return status;
}
