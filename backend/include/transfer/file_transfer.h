#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "events/observer_hub.h"
#include "node/command_result.h"
#include "node/connection_manager.h"
#include "node/identity.h"
#include "protocol/frame_codec.h"

/**
 * Chunked file transfer over an established session.
 *
 * Sending is direct-only: file-offer, then one binary frame per chunk,
 * then file-end. The next chunk is read only after the previous write
 * completed, so a large file never stalls other peers' traffic.
 *
 * Receiving writes {receive_dir}/{epoch_ms}_{filename}, with a numeric
 * suffix when that file already exists. Frames are appended in arrival
 * order; the transport's per-connection ordering is all the sequencing
 * there is. Frames for an unknown fileId, or from a peer other than the
 * one that offered it, are dropped.
 */
class FileTransferEngine {
public:
    struct Settings {
        std::filesystem::path receive_dir = "received";
        std::size_t chunk_size = kDefaultChunkSize;
    };

    static constexpr std::size_t kDefaultChunkSize = 16 * 1024;

    FileTransferEngine(asio::io_context& io,
                       const Identity& identity,
                       ConnectionManager& connections,
                       ObserverHub& hub,
                       Settings settings);

    /// Send to the current direct target.
    CommandResult send_file(const std::filesystem::path& source);

    /// Send to a specific connected peer.
    CommandResult send_file_to(const std::string& peer_id, const std::filesystem::path& source);

    void on_offer(const SessionInfo& from, const nlohmann::json& payload);
    void on_chunk(const SessionInfo& from, const ChunkFrame& frame);
    void on_end(const SessionInfo& from, const nlohmann::json& payload);

    /// Abandon whatever @p peer_id was still sending us.
    void on_peer_closed(const std::string& peer_id);

    [[nodiscard]] std::size_t incoming_count() const { return incoming_.size(); }
    [[nodiscard]] const std::filesystem::path& receive_dir() const { return settings_.receive_dir; }

private:
    struct TransferState {
        std::string           file_id;
        std::string           from_id;
        std::filesystem::path path;
        std::ofstream         sink;
        std::uint64_t         bytes_written = 0;
        std::uint64_t         expected_size = 0;
    };

    struct OutgoingTransfer {
        std::string   file_id;
        std::string   peer_id;
        std::string   filename;
        std::ifstream source;
        Bytes         buffer;
        std::uint64_t size = 0;
        std::uint64_t sent = 0;
    };

    void send_next_chunk(const std::shared_ptr<OutgoingTransfer>& transfer);
    void finish_send(const std::shared_ptr<OutgoingTransfer>& transfer);

    asio::io_context& io_;
    const Identity& identity_;
    ConnectionManager& connections_;
    ObserverHub& hub_;
    Settings settings_;

    std::unordered_map<std::string, TransferState> incoming_;
};
