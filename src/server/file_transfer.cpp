/*
 * AdaTP - file transfer coordinator implementation
 */

#include "file_transfer.hpp"

#include "utils.hpp"

#include <limits>

namespace adatp {

namespace {
std::string transfer_label(const Transfer& transfer) {
    return hex_encode(transfer.id.data(), transfer.id.size()).substr(0, 8) + " (" + transfer.filename + ")";
}

bool same_route(const RoutePrefix& lhs, const RoutePrefix& rhs) {
    if (lhs.direct != rhs.direct) {
        return false;
    }
    return lhs.direct ? lhs.target == rhs.target : lhs.room == rhs.room;
}
} // namespace

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Announced:
            return "Announced";
        case TransferState::Transferring:
            return "Transferring";
        case TransferState::Completed:
            return "Completed";
        case TransferState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

const char* init_verdict_name(InitVerdict verdict) {
    switch (verdict) {
        case InitVerdict::Accepted:
            return "Accepted";
        case InitVerdict::DuplicateId:
            return "DuplicateId";
        case InitVerdict::TooManyTransfers:
            return "TooManyTransfers";
        case InitVerdict::TooManyChunks:
            return "TooManyChunks";
    }
    return "Unknown";
}

const char* chunk_verdict_name(ChunkVerdict verdict) {
    switch (verdict) {
        case ChunkVerdict::Accepted:
            return "Accepted";
        case ChunkVerdict::UnknownTransfer:
            return "UnknownTransfer";
        case ChunkVerdict::NotSender:
            return "NotSender";
        case ChunkVerdict::RouteMismatch:
            return "RouteMismatch";
        case ChunkVerdict::Duplicate:
            return "Duplicate";
        case ChunkVerdict::OutOfRange:
            return "OutOfRange";
        case ChunkVerdict::Oversized:
            return "Oversized";
    }
    return "Unknown";
}

FileTransferCoordinator::FileTransferCoordinator(ServerStats& stats,
                                                 std::size_t max_transfers_per_session,
                                                 std::size_t max_chunks)
    : stats_(stats), max_transfers_per_session_(max_transfers_per_session), max_chunks_(max_chunks) {}

InitVerdict FileTransferCoordinator::on_init(const SessionId& sender,
                                             const FileInitInfo& info,
                                             const RoutePrefix& target) {
    if (info.chunk_size == 0) {
        ++stats_.transfer_rejections;
        return InitVerdict::TooManyChunks;
    }
    uint64_t chunks = info.total_size / info.chunk_size + (info.total_size % info.chunk_size != 0 ? 1 : 0);
    // Checked before the bitmap is sized from the declared counts.
    if (chunks > std::numeric_limits<uint32_t>::max() || chunks > max_chunks_) {
        ++stats_.transfer_rejections;
        log_warn("Refusing transfer of " + std::to_string(info.total_size) + " bytes in " + std::to_string(chunks) +
                 " chunks (limit " + std::to_string(max_chunks_) + ")");
        return InitVerdict::TooManyChunks;
    }

    Transfer transfer;
    transfer.id = info.transfer_id;
    transfer.filename = info.filename;
    transfer.total_size = info.total_size;
    transfer.chunk_size = info.chunk_size;
    transfer.expected_chunks = static_cast<uint32_t>(chunks);
    transfer.sender = sender;
    transfer.target = target;
    transfer.seen.assign(transfer.expected_chunks, false);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfers_.count(info.transfer_id) != 0) {
            ++stats_.transfer_rejections;
            return InitVerdict::DuplicateId;
        }
        std::size_t owned = 0;
        for (const auto& [id, existing] : transfers_) {
            if (existing.sender == sender) {
                ++owned;
            }
        }
        if (owned >= max_transfers_per_session_) {
            ++stats_.transfer_rejections;
            return InitVerdict::TooManyTransfers;
        }
        transfers_.emplace(info.transfer_id, transfer);
    }

    log_info("Transfer " + transfer_label(transfer) + " announced: " + std::to_string(transfer.total_size) +
             " bytes in " + std::to_string(transfer.expected_chunks) + " chunks");
    return InitVerdict::Accepted;
}

ChunkVerdict FileTransferCoordinator::on_chunk(const SessionId& sender,
                                               const RoutePrefix& route,
                                               const FileChunkInfo& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(chunk.transfer_id);
    if (it == transfers_.end()) {
        ++stats_.transfer_rejections;
        return ChunkVerdict::UnknownTransfer;
    }
    Transfer& transfer = it->second;
    if (transfer.sender != sender) {
        ++stats_.transfer_rejections;
        return ChunkVerdict::NotSender;
    }
    if (!same_route(transfer.target, route)) {
        ++stats_.transfer_rejections;
        return ChunkVerdict::RouteMismatch;
    }
    if (chunk.index >= transfer.expected_chunks) {
        stats_.record(ErrorKind::TransferOutOfRange);
        return ChunkVerdict::OutOfRange;
    }
    if (transfer.seen[chunk.index]) {
        ++stats_.transfer_rejections;
        return ChunkVerdict::Duplicate;
    }

    // Every chunk but the last must be exactly chunk_size; the last one
    // carries the remainder.
    uint64_t expected = transfer.chunk_size;
    if (chunk.index + 1 == transfer.expected_chunks) {
        expected = transfer.total_size - static_cast<uint64_t>(chunk.index) * transfer.chunk_size;
    }
    if (chunk.data_length > expected || transfer.received_bytes + chunk.data_length > transfer.total_size) {
        stats_.record(ErrorKind::TransferOutOfRange);
        return ChunkVerdict::Oversized;
    }

    transfer.seen[chunk.index] = true;
    ++transfer.received_chunks;
    transfer.received_bytes += chunk.data_length;
    transfer.state = TransferState::Transferring;
    return ChunkVerdict::Accepted;
}

std::optional<Transfer> FileTransferCoordinator::on_complete(const SessionId& sender,
                                                            const RoutePrefix& route,
                                                            const TransferId& id) {
    Transfer finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end() || it->second.sender != sender || !same_route(it->second.target, route)) {
            ++stats_.transfer_rejections;
            return std::nullopt;
        }
        finished = std::move(it->second);
        transfers_.erase(it);
    }

    if (finished.received_bytes == finished.total_size) {
        finished.state = TransferState::Completed;
        ++stats_.transfers_completed;
        log_info("Transfer " + transfer_label(finished) + " completed");
    } else {
        finished.state = TransferState::Aborted;
        finished.abort_reason = AbortReason::SizeMismatch;
        stats_.record(ErrorKind::TransferSizeMismatch);
        log_warn("Transfer " + transfer_label(finished) + " aborted: received " +
                 std::to_string(finished.received_bytes) + " of " + std::to_string(finished.total_size) + " bytes");
    }
    return finished;
}

std::optional<Transfer> FileTransferCoordinator::on_abort(const SessionId& sender,
                                                         const RoutePrefix& route,
                                                         const TransferId& id) {
    Transfer aborted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end() || it->second.sender != sender || !same_route(it->second.target, route)) {
            return std::nullopt;
        }
        aborted = std::move(it->second);
        transfers_.erase(it);
    }
    const TransferState previous = aborted.state;
    aborted.state = TransferState::Aborted;
    aborted.abort_reason = AbortReason::SenderAborted;
    ++stats_.transfers_aborted;
    log_info("Transfer " + transfer_label(aborted) + " aborted by sender while " + transfer_state_name(previous));
    return aborted;
}

std::vector<Transfer> FileTransferCoordinator::abort_all_from(const SessionId& sender) {
    std::vector<Transfer> aborted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->second.sender == sender) {
                aborted.push_back(std::move(it->second));
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& transfer : aborted) {
        transfer.state = TransferState::Aborted;
        transfer.abort_reason = AbortReason::SenderGone;
        ++stats_.transfers_aborted;
        log_info("Transfer " + transfer_label(transfer) + " aborted: sender disconnected");
    }
    return aborted;
}

std::optional<Transfer> FileTransferCoordinator::find(const TransferId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t FileTransferCoordinator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

void FileTransferCoordinator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_.clear();
}

} // namespace adatp
