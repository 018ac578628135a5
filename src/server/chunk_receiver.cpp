#include "chunked/server/chunk_receiver.hpp"

#include "chunked/core/identifiers.hpp"
#include "chunked/events/events.hpp"

#include <spdlog/spdlog.h>

namespace chunked::server {

ChunkUpload::ChunkUpload(std::string fingerprint,
                         std::uint32_t index,
                         std::uint64_t declared_length,
                         std::unique_ptr<storage::ChunkWriter> writer,
                         storage::FingerprintGate::Lease lease,
                         events::EventBus& bus)
    : fingerprint_(std::move(fingerprint)),
      index_(index),
      declared_length_(declared_length),
      writer_(std::move(writer)),
      lease_(std::move(lease)),
      bus_(bus) {
}

ChunkUpload::~ChunkUpload() {
    if (!finished_) {
        abort("upload abandoned before completion");
    }
}

std::uint64_t ChunkUpload::bytes_received() const noexcept {
    return writer_ ? writer_->bytes_written() : 0;
}

Result<void> ChunkUpload::write(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        return Err<void>(ErrorCode::InvalidArgument, "chunk upload already finished");
    }
    if (writer_->bytes_written() + size > declared_length_) {
        return Err<void>(ErrorCode::InvalidArgument, "chunk body longer than declared length");
    }
    return writer_->append(data, size);
}

Result<ChunkReceipt> ChunkUpload::commit() {
    if (finished_) {
        return Err<ChunkReceipt>(ErrorCode::InvalidArgument, "chunk upload already finished");
    }

    const auto received = writer_->bytes_written();
    if (received != declared_length_) {
        abort("incomplete body");
        return Err<ChunkReceipt>(ErrorCode::InvalidArgument,
                                 "chunk body incomplete: received " + std::to_string(received) +
                                 " of " + std::to_string(declared_length_) + " bytes");
    }

    auto res = writer_->commit();
    finished_ = true;
    lease_.release();
    if (res.is_error()) {
        spdlog::error("Chunk {}/{} could not be stored: {}", fingerprint_, index_, res.error().message);
        return Err<ChunkReceipt>(res.error());
    }

    bus_.emit(events::ChunkStoredEvent{fingerprint_, index_, received});
    return Ok(ChunkReceipt{fingerprint_, index_, received});
}

void ChunkUpload::abort(const std::string& reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    const auto discarded = writer_->bytes_written();
    writer_->discard();
    lease_.release();
    bus_.emit(events::ChunkCancelledEvent{fingerprint_, index_, discarded, reason});
}

ChunkReceiver::ChunkReceiver(storage::StagingArea& staging,
                             storage::FingerprintGate& gate,
                             events::EventBus& bus,
                             std::uint64_t max_chunk_bytes)
    : staging_(staging),
      gate_(gate),
      bus_(bus),
      max_chunk_bytes_(max_chunk_bytes) {
}

Result<std::unique_ptr<ChunkUpload>> ChunkReceiver::begin(const std::string& fingerprint,
                                                          const std::string& index,
                                                          std::uint64_t declared_length) {
    using UploadPtr = std::unique_ptr<ChunkUpload>;

    if (auto res = validate_fingerprint(fingerprint); res.is_error()) {
        return Err<UploadPtr>(res.error());
    }
    auto parsed_index = parse_chunk_index(index);
    if (parsed_index.is_error()) {
        return Err<UploadPtr>(parsed_index.error());
    }
    if (declared_length > max_chunk_bytes_) {
        return Err<UploadPtr>(ErrorCode::ChunkTooLarge,
                              "chunk of " + std::to_string(declared_length) +
                              " bytes exceeds limit of " + std::to_string(max_chunk_bytes_));
    }

    auto lease = gate_.try_shared(fingerprint);
    if (!lease) {
        spdlog::warn("Chunk {}/{} rejected: merge in progress", fingerprint, index);
        return Err<UploadPtr>(ErrorCode::MergeInProgress, "fingerprint is being merged: " + fingerprint);
    }

    auto writer = staging_.open_writer(fingerprint, parsed_index.value());
    if (writer.is_error()) {
        spdlog::error("Chunk {}/{}: {}", fingerprint, index, writer.error().message);
        return Err<UploadPtr>(writer.error());
    }

    return Ok(std::make_unique<ChunkUpload>(fingerprint,
                                            parsed_index.value(),
                                            declared_length,
                                            std::move(writer.value()),
                                            std::move(*lease),
                                            bus_));
}

Result<ChunkReceipt> ChunkReceiver::receive(const std::string& fingerprint,
                                            const std::string& index,
                                            const std::vector<std::uint8_t>& bytes) {
    auto upload = begin(fingerprint, index, bytes.size());
    if (upload.is_error()) {
        return Err<ChunkReceipt>(upload.error());
    }
    auto& chunk = *upload.value();
    if (auto res = chunk.write(bytes.data(), bytes.size()); res.is_error()) {
        chunk.abort("write failed");
        return Err<ChunkReceipt>(res.error());
    }
    return chunk.commit();
}

} // namespace chunked::server
