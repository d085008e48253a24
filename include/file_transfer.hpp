/*
 * AdaTP - file transfer coordinator
 *
 * Observes FILE_INIT / FILE_CHUNK / FILE_COMPLETE / FILE_ABORT on their way
 * through the router and keeps per-transfer accounting. Chunk data itself is
 * never buffered here; accepted chunks are forwarded like any other packet.
 *
 *   Announced --first chunk--> Transferring --complete--> Completed
 *       \                          |
 *        +-------------------------+--size mismatch / abort--> Aborted
 */

#pragma once

#include "messages.hpp"
#include "protocol.hpp"
#include "stats.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace adatp {

enum class TransferState {
    Announced,
    Transferring,
    Completed,
    Aborted
};

const char* transfer_state_name(TransferState state);

struct Transfer {
    TransferId id{};
    std::string filename;
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    uint32_t expected_chunks = 0;
    SessionId sender{};
    RoutePrefix target;
    uint64_t received_bytes = 0;
    uint32_t received_chunks = 0;
    std::vector<bool> seen;
    TransferState state = TransferState::Announced;
    std::optional<AbortReason> abort_reason;
};

enum class InitVerdict {
    Accepted,
    DuplicateId,
    TooManyTransfers,
    TooManyChunks
};

enum class ChunkVerdict {
    Accepted,
    UnknownTransfer,
    NotSender,
    RouteMismatch,
    Duplicate,
    OutOfRange,
    Oversized
};

const char* init_verdict_name(InitVerdict verdict);
const char* chunk_verdict_name(ChunkVerdict verdict);

class FileTransferCoordinator {
public:
    // max_chunks bounds the chunk count a FILE_INIT may declare.
    FileTransferCoordinator(ServerStats& stats, std::size_t max_transfers_per_session, std::size_t max_chunks);

    FileTransferCoordinator(const FileTransferCoordinator&) = delete;
    FileTransferCoordinator& operator=(const FileTransferCoordinator&) = delete;

    InitVerdict on_init(const SessionId& sender, const FileInitInfo& info, const RoutePrefix& target);

    ChunkVerdict on_chunk(const SessionId& sender, const RoutePrefix& route, const FileChunkInfo& chunk);

    // Finalizes the transfer. The returned copy is Completed when the byte
    // count matches the declared size and Aborted(SizeMismatch) otherwise;
    // nullopt when the sender has no such transfer on this route.
    std::optional<Transfer> on_complete(const SessionId& sender, const RoutePrefix& route, const TransferId& id);

    // Sender-initiated abort; same matching rules as on_complete.
    std::optional<Transfer> on_abort(const SessionId& sender, const RoutePrefix& route, const TransferId& id);

    // Aborts every outstanding transfer of a departing sender.
    std::vector<Transfer> abort_all_from(const SessionId& sender);

    std::optional<Transfer> find(const TransferId& id) const;
    std::size_t active_count() const;

    void clear();

private:
    ServerStats& stats_;
    const std::size_t max_transfers_per_session_;
    const std::size_t max_chunks_;
    mutable std::mutex mutex_;
    std::unordered_map<TransferId, Transfer, SessionIdHash> transfers_;
};

} // namespace adatp
