/**
 * FileTransferEngine — chunked send and per-fileId reassembly.
 */

#include "transfer/file_transfer.h"

#include <chrono>
#include <system_error>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "crypto/id_generator.h"

namespace fs = std::filesystem;

namespace {

std::int64_t epoch_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// {dir}/{epoch_ms}_{name}, or {epoch_ms}_{stem}-{n}{ext} if that is taken.
fs::path unused_path(const fs::path& dir, const fs::path& name) {
    const std::string prefix = std::to_string(epoch_millis()) + "_";
    fs::path candidate = dir / (prefix + name.string());
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = dir / (prefix + name.stem().string() + "-" + std::to_string(n) +
                           name.extension().string());
    }
    return candidate;
}

} // namespace

FileTransferEngine::FileTransferEngine(asio::io_context& io,
                                       const Identity& identity,
                                       ConnectionManager& connections,
                                       ObserverHub& hub,
                                       Settings settings)
    : io_(io),
      identity_(identity),
      connections_(connections),
      hub_(hub),
      settings_(std::move(settings)) {
    if (settings_.chunk_size == 0) settings_.chunk_size = kDefaultChunkSize;
}

CommandResult FileTransferEngine::send_file(const fs::path& source) {
    auto target = connections_.direct_target();
    if (!target) return CommandResult::NoDirectTarget;
    return send_file_to(*target, source);
}

CommandResult FileTransferEngine::send_file_to(const std::string& peer_id, const fs::path& source) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) return CommandResult::FileNotFound;
    const auto size = fs::file_size(source, ec);
    if (ec) return CommandResult::FileNotFound;
    if (!connections_.is_connected(peer_id)) return CommandResult::PeerNotConnected;

    auto transfer = std::make_shared<OutgoingTransfer>();
    transfer->source.open(source, std::ios::binary);
    if (!transfer->source.is_open()) return CommandResult::FileNotFound;

    transfer->file_id = IdGenerator::uuid();
    transfer->peer_id = peer_id;
    transfer->filename = source.filename().string();
    transfer->size = size;
    transfer->buffer.resize(settings_.chunk_size);

    ControlMessage offer;
    offer.type = MessageType::FileOffer;
    offer.payload["fromId"] = identity_.id;
    offer.payload["fromName"] = identity_.username;
    offer.payload["fileId"] = transfer->file_id;
    offer.payload["filename"] = transfer->filename;
    offer.payload["size"] = transfer->size;
    connections_.send_to(peer_id, offer);

    spdlog::info("Sending {} ({} bytes) to {} as {}", transfer->filename, size, peer_id, transfer->file_id);
    send_next_chunk(transfer);
    return CommandResult::Ok;
}

void FileTransferEngine::send_next_chunk(const std::shared_ptr<OutgoingTransfer>& transfer) {
    transfer->source.read(reinterpret_cast<char*>(transfer->buffer.data()),
                          static_cast<std::streamsize>(transfer->buffer.size()));
    const auto got = static_cast<std::size_t>(transfer->source.gcount());
    if (got == 0) {
        if (transfer->source.bad()) {
            hub_.notice(NoticeLevel::Error,
                        fmt::format("Reading {} failed after {} bytes", transfer->filename, transfer->sent));
            return;
        }
        finish_send(transfer);
        return;
    }

    Bytes frame = FrameCodec::encode_chunk(transfer->file_id, transfer->buffer.data(), got);
    transfer->sent += got;

    const bool queued = connections_.send_binary(transfer->peer_id, std::move(frame),
        [this, transfer](const std::error_code& ec) {
            if (ec) {
                hub_.notice(NoticeLevel::Warning,
                            fmt::format("Transfer of {} aborted: {}", transfer->filename, ec.message()));
                return;
            }
            asio::post(io_, [this, transfer] { send_next_chunk(transfer); });
        });
    if (!queued) {
        hub_.notice(NoticeLevel::Warning,
                    fmt::format("Transfer of {} aborted: peer disconnected", transfer->filename));
    }
}

void FileTransferEngine::finish_send(const std::shared_ptr<OutgoingTransfer>& transfer) {
    ControlMessage end;
    end.type = MessageType::FileEnd;
    end.payload["fileId"] = transfer->file_id;
    if (!connections_.send_to(transfer->peer_id, end)) {
        hub_.notice(NoticeLevel::Warning,
                    fmt::format("Transfer of {} aborted: peer disconnected", transfer->filename));
        return;
    }
    auto name = transfer->peer_id;
    if (auto session = connections_.session(transfer->peer_id)) name = session->name;
    hub_.notice(NoticeLevel::Info,
                fmt::format("Sent: {} ({} bytes) to {}", transfer->filename, transfer->sent, name));
}

void FileTransferEngine::on_offer(const SessionInfo& from, const nlohmann::json& payload) {
    const std::string file_id = string_field(payload, "fileId");
    const std::string offered = string_field(payload, "filename");
    if (file_id.empty() || offered.empty()) {
        spdlog::warn("Dropping file-offer without fileId or filename from {}", from.name);
        return;
    }
    if (incoming_.count(file_id) != 0) {
        spdlog::warn("Dropping duplicate file-offer {} from {}", file_id, from.name);
        return;
    }

    // Only the last path component is used: the sender never picks our directory.
    const fs::path name = fs::path(offered).filename();
    if (name.empty() || name == "." || name == "..") {
        spdlog::warn("Dropping file-offer with unusable filename '{}' from {}", offered, from.name);
        return;
    }

    std::error_code ec;
    fs::create_directories(settings_.receive_dir, ec);
    if (ec) {
        hub_.notice(NoticeLevel::Error, fmt::format("Cannot create {}: {}",
                                                    settings_.receive_dir.string(), ec.message()));
        return;
    }

    TransferState state;
    state.file_id = file_id;
    state.from_id = from.peer_id;
    state.path = unused_path(settings_.receive_dir, name);
    state.expected_size = static_cast<std::uint64_t>(int_field(payload, "size").value_or(0));
    state.sink.open(state.path, std::ios::binary | std::ios::trunc);
    if (!state.sink.is_open()) {
        hub_.notice(NoticeLevel::Error, fmt::format("Cannot write {}", state.path.string()));
        return;
    }

    hub_.notice(NoticeLevel::Info,
                fmt::format("Receiving file from {}: {}", from.name, name.string()));
    incoming_.emplace(file_id, std::move(state));
}

void FileTransferEngine::on_chunk(const SessionInfo& from, const ChunkFrame& frame) {
    auto it = incoming_.find(frame.file_id);
    if (it == incoming_.end()) return;
    if (it->second.from_id != from.peer_id) {
        spdlog::warn("Dropping chunk for {} from {}, who did not offer it", frame.file_id, from.name);
        return;
    }

    TransferState& state = it->second;
    if (!frame.data.empty()) {
        state.sink.write(reinterpret_cast<const char*>(frame.data.data()),
                         static_cast<std::streamsize>(frame.data.size()));
    }
    state.bytes_written += frame.data.size();
}

void FileTransferEngine::on_end(const SessionInfo& from, const nlohmann::json& payload) {
    auto it = incoming_.find(string_field(payload, "fileId"));
    if (it == incoming_.end()) return;
    if (it->second.from_id != from.peer_id) {
        spdlog::warn("Dropping file-end for {} from {}, who did not offer it", it->first, from.name);
        return;
    }

    TransferState state = std::move(it->second);
    incoming_.erase(it);

    state.sink.flush();
    const bool ok = static_cast<bool>(state.sink);
    state.sink.close();
    if (!ok) {
        hub_.notice(NoticeLevel::Error, fmt::format("Writing {} failed", state.path.string()));
        return;
    }
    if (state.expected_size != 0 && state.expected_size != state.bytes_written) {
        spdlog::warn("{}: offered {} bytes, received {}", state.path.string(), state.expected_size,
                     state.bytes_written);
    }

    hub_.notice(NoticeLevel::Info, fmt::format("File saved: {}", state.path.string()));
    hub_.file_received(ReceivedFile{state.file_id, state.from_id, state.path.string(), state.bytes_written});
}

void FileTransferEngine::on_peer_closed(const std::string& peer_id) {
    for (auto it = incoming_.begin(); it != incoming_.end();) {
        if (it->second.from_id != peer_id) {
            ++it;
            continue;
        }
        it->second.sink.close();
        hub_.notice(NoticeLevel::Warning,
                    fmt::format("Incomplete transfer kept at {} ({} bytes)",
                                it->second.path.string(), it->second.bytes_written));
        it = incoming_.erase(it);
    }
}
