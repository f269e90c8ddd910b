/**
 * @file rpc_codec.hpp
 * @brief Binary serialization of scheduler RPC messages.
 *
 * Envelope (all multi-byte values big-endian):
 *
 * Request:
 *   [1B message type][body]
 *
 * Response:
 *   [1B message type][1B status: 0=ok, 1=error]
 *   ok:    [body]
 *   error: [1B ErrorCode][4B message_len][message bytes]
 *
 * Body fields are written in declaration order: integers fixed-width,
 * doubles as IEEE-754 bit patterns in a u64, bools as one byte, strings as
 * [4B len][bytes], lists as [4B count][elements].
 */

#pragma once

#include "core/result.hpp"
#include "rpc/messages.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Appends big-endian primitives to a byte buffer.
 */
class WireWriter {
public:
    void put_u8(uint8_t val) { buf_.push_back(val); }
    void put_u32(uint32_t val);
    void put_u64(uint64_t val);
    void put_i32(int32_t val) { put_u32(static_cast<uint32_t>(val)); }
    void put_i64(int64_t val) { put_u64(static_cast<uint64_t>(val)); }
    void put_f64(double val);
    void put_bool(bool val) { put_u8(val ? 1 : 0); }
    void put_string(const std::string& val);
    void put_strings(const std::vector<std::string>& vals);

    [[nodiscard]] std::vector<uint8_t>& bytes() noexcept { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

/**
 * @brief Reads big-endian primitives with bounds checking.
 *
 * A read past the end marks the reader failed and yields zero values;
 * callers check ok() once after decoding a whole message.
 */
class WireReader {
public:
    explicit WireReader(const std::vector<uint8_t>& data, size_t offset = 0)
        : data_(data), offset_(offset) {}

    uint8_t get_u8();
    uint32_t get_u32();
    uint64_t get_u64();
    int32_t get_i32() { return static_cast<int32_t>(get_u32()); }
    int64_t get_i64() { return static_cast<int64_t>(get_u64()); }
    double get_f64();
    bool get_bool();
    std::string get_string();
    std::vector<std::string> get_strings();

    /// Mark the message malformed (e.g. an implausible element count).
    void fail() noexcept { ok_ = false; }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] bool at_end() const noexcept { return offset_ == data_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    bool need(size_t n);

    const std::vector<uint8_t>& data_;
    size_t offset_;
    bool ok_{true};
};

struct RpcCodec {
    static constexpr uint8_t STATUS_OK = 0x00;
    static constexpr uint8_t STATUS_ERROR = 0x01;

    static std::vector<uint8_t> encode_request(const RpcRequest& request);
    static Result<RpcRequest> decode_request(const std::vector<uint8_t>& data);

    static std::vector<uint8_t> encode_response(const RpcResponse& response);
    static std::vector<uint8_t> encode_error(MessageType type, const Error& error);

    /// Error responses decode to their carried Error; malformed input to Protocol.
    static Result<RpcResponse> decode_response(const std::vector<uint8_t>& data);
};

}  // namespace tco_scheduler
