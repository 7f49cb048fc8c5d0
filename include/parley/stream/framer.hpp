#pragma once

#include <parley/common.hpp>

#include <algorithm>
#include <deque>

namespace parley {

    /// Prefix a payload with its 4-byte big-endian length
    inline Bytes frame(const Bytes &payload) {
        Bytes out;
        out.reserve(payload.size() + 4);
        append_u32_be(out, static_cast<dp::u32>(payload.size()));
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    /// Reassembles length-prefixed frames from a byte stream
    ///
    /// Reads may deliver any number of bytes: zero, one or many whole frames, or a
    /// frame split at any point (including inside the length header). Completed
    /// frames queue up until popped.
    ///
    /// AwaitingLength (0-4 header bytes buffered) -> AwaitingBody -> frame ready,
    /// back to AwaitingLength
    class FrameAssembler {
      public:
        enum class State { AwaitingLength, AwaitingBody };

      private:
        State state_;
        dp::Array<dp::u8, 4> header_;
        dp::usize header_fill_;
        dp::u32 body_length_;
        Bytes body_;
        std::deque<Bytes> ready_;
        dp::u32 max_frame_size_;
        bool failed_;

      public:
        explicit FrameAssembler(dp::u32 max_frame_size = MAX_FRAME_SIZE)
            : state_(State::AwaitingLength), header_fill_(0), body_length_(0), max_frame_size_(max_frame_size),
              failed_(false) {}

        /// Consume a chunk of stream bytes
        /// Returns the number of frames completed by this chunk, or an error when a
        /// header claims more than the maximum frame size. After that error the
        /// assembler stays failed: the stream is out of sync and must be closed.
        dp::Res<dp::usize> feed(const dp::u8 *data, dp::usize size) {
            if (failed_) {
                return dp::result::err(dp::Error::invalid_argument("frame too large"));
            }

            dp::usize completed = 0;
            dp::usize pos = 0;
            while (pos < size) {
                if (state_ == State::AwaitingLength) {
                    while (header_fill_ < 4 && pos < size) {
                        header_[header_fill_++] = data[pos++];
                    }
                    if (header_fill_ < 4) {
                        break;
                    }

                    body_length_ = decode_u32_be(header_.data());
                    if (body_length_ > max_frame_size_) {
                        echo::error("frame too large: ", body_length_, " bytes (max: ", max_frame_size_, ")");
                        failed_ = true;
                        return dp::result::err(dp::Error::invalid_argument("frame too large"));
                    }

                    body_.clear();
                    body_.reserve(body_length_);
                    state_ = State::AwaitingBody;
                }

                dp::usize want = body_length_ - body_.size();
                dp::usize take = std::min(want, size - pos);
                body_.insert(body_.end(), data + pos, data + pos + take);
                pos += take;

                if (body_.size() == body_length_) {
                    echo::trace("frame complete, ", body_length_, " bytes");
                    ready_.push_back(std::move(body_));
                    body_ = Bytes();
                    header_fill_ = 0;
                    body_length_ = 0;
                    state_ = State::AwaitingLength;
                    ++completed;
                }
            }

            return dp::result::ok(completed);
        }

        dp::Res<dp::usize> feed(const Bytes &chunk) { return feed(chunk.data(), chunk.size()); }

        bool has_frame() const { return !ready_.empty(); }

        dp::usize ready_count() const { return ready_.size(); }

        /// Take the oldest completed frame; call only when has_frame()
        Bytes pop_frame() {
            Bytes out = std::move(ready_.front());
            ready_.pop_front();
            return out;
        }

        State state() const { return state_; }

        /// Bytes held for the frame in progress (header and body)
        dp::usize buffered() const { return state_ == State::AwaitingLength ? header_fill_ : 4 + body_.size(); }

        bool failed() const { return failed_; }

        void reset() {
            state_ = State::AwaitingLength;
            header_fill_ = 0;
            body_length_ = 0;
            body_.clear();
            ready_.clear();
            failed_ = false;
        }
    };

} // namespace parley
