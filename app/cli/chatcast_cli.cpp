#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Base64.h"
#include "IntegrityCodec.h"
#include "Logger.h"
#include "RelayClient.h"

using namespace ChatCast;

/**
 * @brief ChatCast command line client
 *
 * Talks to a running chatcast_relay: sends a chat message, uploads a file
 * as tagged chunks, or asks which chunks of a transfer are still missing.
 */
namespace {

    const std::chrono::milliseconds REPLY_WAIT{1500};
    const size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
    const int MAX_RESUME_ROUNDS = 3;

    void printUsage() {
        std::cout << "ChatCast CLI" << std::endl;
        std::cout << "Usage: chatcast_cli [--key <hmac-key>] <command> [args]" << std::endl;
        std::cout << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  msg <host> <port> <seq> <text>                Send a tagged chat message" << std::endl;
        std::cout << "  send-file <host> <port> <path> [chunk-size]   Upload a file as chunks" << std::endl;
        std::cout << "  resume <host> <port> <transfer-id>            Ask which chunks are missing" << std::endl;
        std::cout << std::endl;
        std::cout << "Tags use CRC-32 unless --key selects HMAC-SHA256 (must match the relay)." << std::endl;
    }

    std::string describe(const ControlFrame& frame) {
        std::ostringstream out;
        out << frame.commandName;
        if (frame.sequence) out << " seq=" << *frame.sequence;
        if (frame.transferId) out << " transfer=" << *frame.transferId;
        if (frame.reason) out << " reason=" << *frame.reason;
        if (frame.integrityStatus) out << " integrity=" << *frame.integrityStatus;
        if (frame.command == ControlCommand::MISSING) {
            out << " missing=[";
            for (size_t i = 0; i < frame.missing.size(); ++i) {
                out << (i ? "," : "") << frame.missing[i];
            }
            out << "]";
        }
        return out.str();
    }

    bool parseNumber(const std::string& text, uint64_t max, uint64_t& out) {
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        try {
            out = std::stoull(text);
        } catch (const std::out_of_range&) {
            return false;
        }
        return out <= max;
    }

    std::string baseName(const std::string& path) {
        size_t slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    std::string newTransferId(const std::string& path) {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto now = std::chrono::system_clock::now().time_since_epoch();
        std::ostringstream id;
        id << baseName(path) << "-" << std::hex << std::chrono::duration_cast<std::chrono::milliseconds>(now).count()
           << "-" << (gen() & 0xFFFFFFFFULL);
        return id.str();
    }

    int connectOrFail(RelayClient& client, const std::string& host, const std::string& portText) {
        uint64_t port = 0;
        if (!parseNumber(portText, 65535, port)) {
            std::cerr << "Invalid port: " << portText << std::endl;
            return 1;
        }
        auto connected = client.connect(host, static_cast<int>(port));
        if (connected.isError()) {
            std::cerr << connected.error().message << std::endl;
            return 1;
        }
        return 0;
    }

    void printReplies(const std::vector<ControlFrame>& replies) {
        for (const auto& reply : replies) {
            std::cout << describe(reply) << std::endl;
        }
    }

    int runMessage(const IIntegrityCodec& codec, const std::vector<std::string>& args) {
        if (args.size() != 4) {
            printUsage();
            return 1;
        }
        uint64_t seq = 0;
        if (!parseNumber(args[2], UINT32_MAX, seq)) {
            std::cerr << "Invalid sequence: " << args[2] << std::endl;
            return 1;
        }

        RelayClient client;
        if (connectOrFail(client, args[0], args[1]) != 0) return 1;

        MessageFrame msg;
        msg.sequence = static_cast<uint32_t>(seq);
        msg.payload.assign(args[3].begin(), args[3].end());
        msg.integrityTag = codec.tag(msg.payload, msg.sequence);

        auto sent = client.send(msg);
        if (sent.isError()) {
            std::cerr << sent.error().message << std::endl;
            return 1;
        }

        auto replies = client.drain(REPLY_WAIT);
        printReplies(replies);
        return replies.empty() ? 1 : 0;
    }

    int runSendFile(const IIntegrityCodec& codec, const std::vector<std::string>& args) {
        if (args.size() != 3 && args.size() != 4) {
            printUsage();
            return 1;
        }
        uint64_t chunkSize = DEFAULT_CHUNK_SIZE;
        if (args.size() == 4 && (!parseNumber(args[3], UINT32_MAX, chunkSize) || chunkSize == 0)) {
            std::cerr << "Invalid chunk size: " << args[3] << std::endl;
            return 1;
        }

        std::ifstream file(args[2], std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Cannot open " << args[2] << std::endl;
            return 1;
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        uint64_t totalChunks = (data.size() + chunkSize - 1) / chunkSize;
        if (totalChunks == 0 || totalChunks > UINT32_MAX) {
            std::cerr << "Cannot send " << args[2] << " (" << data.size() << " bytes) in chunks of "
                      << chunkSize << std::endl;
            return 1;
        }

        RelayClient client;
        if (connectOrFail(client, args[0], args[1]) != 0) return 1;

        std::string transferId = newTransferId(args[2]);
        std::string filename = baseName(args[2]);
        std::cout << "Transfer " << transferId << ": " << data.size() << " bytes in " << totalChunks
                  << " chunks" << std::endl;

        auto sendChunk = [&](uint32_t seq) {
            size_t start = static_cast<size_t>(seq) * chunkSize;
            size_t end = std::min(start + static_cast<size_t>(chunkSize), data.size());
            std::vector<uint8_t> payload(data.begin() + start, data.begin() + end);

            FileChunkFrame chunk;
            chunk.transferId = transferId;
            chunk.sequence = seq;
            chunk.totalChunks = static_cast<uint32_t>(totalChunks);
            chunk.chunkSizeHint = static_cast<uint32_t>(chunkSize);
            chunk.filename = filename;
            chunk.totalSize = data.size();
            chunk.integrityTag = codec.tag(payload, seq);
            chunk.payloadBase64 = Base64::encode(payload);
            return client.send(chunk);
        };

        for (uint32_t seq = 0; seq < totalChunks; ++seq) {
            auto sent = sendChunk(seq);
            if (sent.isError()) {
                std::cerr << sent.error().message << std::endl;
                return 1;
            }
        }
        printReplies(client.drain(REPLY_WAIT));

        // Retransmit whatever the relay still reports missing
        for (int round = 0; round < MAX_RESUME_ROUNDS; ++round) {
            ControlFrame resume = ControlFrame::make(ControlCommand::RESUME_REQUEST);
            resume.transferId = transferId;
            auto sent = client.send(resume);
            if (sent.isError()) {
                std::cerr << sent.error().message << std::endl;
                return 1;
            }

            auto replies = client.drain(REPLY_WAIT);
            printReplies(replies);

            std::vector<uint32_t> missing;
            bool complete = false;
            for (const auto& reply : replies) {
                if (reply.command == ControlCommand::MISSING) {
                    missing = reply.missing;
                } else if (reply.command == ControlCommand::CUM_ACK && reply.sequence &&
                           *reply.sequence == static_cast<int64_t>(totalChunks) - 1) {
                    complete = true;
                }
            }
            if (complete) {
                std::cout << "Transfer " << transferId << " complete" << std::endl;
                return 0;
            }
            for (uint32_t seq : missing) {
                if (seq >= totalChunks) continue;
                auto resent = sendChunk(seq);
                if (resent.isError()) {
                    std::cerr << resent.error().message << std::endl;
                    return 1;
                }
            }
            printReplies(client.drain(REPLY_WAIT));
        }

        std::cerr << "Transfer " << transferId << " incomplete after " << MAX_RESUME_ROUNDS
                  << " resume rounds" << std::endl;
        return 1;
    }

    int runResume(const std::vector<std::string>& args) {
        if (args.size() != 3) {
            printUsage();
            return 1;
        }

        RelayClient client;
        if (connectOrFail(client, args[0], args[1]) != 0) return 1;

        ControlFrame resume = ControlFrame::make(ControlCommand::RESUME_REQUEST);
        resume.transferId = args[2];
        auto sent = client.send(resume);
        if (sent.isError()) {
            std::cerr << sent.error().message << std::endl;
            return 1;
        }

        auto replies = client.drain(REPLY_WAIT);
        printReplies(replies);
        return replies.empty() ? 1 : 0;
    }

}

int main(int argc, char* argv[]) {
    Logger::instance().setLevel(LogLevel::WARN);

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string key;
    if (args.size() >= 2 && args[0] == "--key") {
        key = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "help") {
        printUsage();
        return args.empty() ? 1 : 0;
    }

    auto codec = makeIntegrityCodec(key.empty() ? "crc32" : "hmac-sha256", key);
    if (codec.isError()) {
        std::cerr << codec.error().message << std::endl;
        return 1;
    }

    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "msg") {
        return runMessage(*codec.value(), rest);
    }
    if (command == "send-file") {
        return runSendFile(*codec.value(), rest);
    }
    if (command == "resume") {
        return runResume(rest);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}
