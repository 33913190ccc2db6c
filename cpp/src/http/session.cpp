#include "postsink/http/session.hpp"
#include "postsink/http/body.hpp"
#include "postsink/http/message.hpp"
#include "postsink/http/parser.hpp"
#include "postsink/net/reader.hpp"
#include "postsink/core/log.hpp"

#include <algorithm>
#include <memory>
#include <string>

namespace postsink::http {
    using postsink::core::Status;
    using postsink::core::StatusCode;
    using postsink::core::StatusDomain;
    using postsink::core::make_status;
    using postsink::core::ok_status;
    using postsink::core::is_ok;
    using postsink::core::log_printf;
    using postsink::net::Connection;
    using postsink::net::ConnReader;

    namespace {
        enum class HeadRead : u8 {
            Ready = 0,
            Closed,     // Peer went away between requests
            Rejected,   // Answer with *reject and close
        };

        // Sends the interim 100 response the first time the body is read, so a
        // request refused before its body is touched never asks for it.
        class ContinueGate final : public postsink::ingest::BodyReader {
        public:
            ContinueGate(Connection& conn, HttpBodyReader& body, bool armed) noexcept
                : conn_(conn), body_(body), armed_(armed) {}

            [[nodiscard]] Status read(u8* buf, u32 cap, u32* got) noexcept override {
                if (armed_ && !sent_) {
                    sent_ = true;
                    const postsink::core::BufferView v = postsink::core::view_of(kContinueResponse);
                    Status s = conn_.write_all(v.data, v.len);
                    if (!is_ok(s)) {
                        return s;
                    }
                }
                return body_.read(buf, cap, got);
            }

            // True while the client is still waiting for permission to send.
            [[nodiscard]] bool withheld() const noexcept { return armed_ && !sent_; }

        private:
            Connection& conn_;
            HttpBodyReader& body_;
            bool armed_{false};
            bool sent_{false};
        };

        [[nodiscard]] Status write_string(Connection& conn, const std::string& s) noexcept {
            const postsink::core::BufferView v = postsink::core::view_of(s);
            return conn.write_all(v.data, v.len);
        }

        void reject(Connection& conn, u16 status) noexcept {
            log_printf("http: %s: %u %s", conn.remote(), static_cast<unsigned>(status), status_reason(status));
            const std::string wire = format_response(status, status_reason(status), ConnectionHeader::Close);
            Status s = write_string(conn, wire);
            if (!is_ok(s)) {
                postsink::core::log_status("http: error response", s);
            }
        }

        // Stray CRLFs between requests are ignored.
        void skip_blank_lines(ConnReader& reader) noexcept {
            for (;;) {
                const postsink::core::BufferView in = reader.pending();
                if (in.len >= 1 && in.data[0] == '\n') {
                    reader.consume(1);
                } else if (in.len >= 2 && in.data[0] == '\r' && in.data[1] == '\n') {
                    reader.consume(2);
                } else {
                    return;
                }
            }
        }

        [[nodiscard]] HeadRead read_head(ConnReader& reader, RequestHead* head, u16* reject_status) noexcept {
            for (;;) {
                skip_blank_lines(reader);
                u32 consumed = 0;
                switch (parse_request_head(reader.pending(), head, &consumed)) {
                    case ParseResult::Ok:
                        reader.consume(consumed);
                        return HeadRead::Ready;
                    case ParseResult::Invalid:
                        *reject_status = 400;
                        return HeadRead::Rejected;
                    case ParseResult::TooLarge:
                        *reject_status = 431;
                        return HeadRead::Rejected;
                    case ParseResult::NeedMore:
                        break;
                }

                u32 n = 0;
                Status s = reader.fill(&n);
                if (s.code == StatusCode::TooLarge) {
                    *reject_status = 431;
                    return HeadRead::Rejected;
                }
                if (!is_ok(s) || n == 0) {
                    return HeadRead::Closed;
                }
            }
        }

        [[nodiscard]] bool drain(HttpBodyReader& body, u64 limit) noexcept {
            u8 scratch[4096];
            u64 total = 0;
            while (!body.complete()) {
                if (total >= limit) {
                    return false;
                }
                const u32 want = static_cast<u32>(std::min<u64>(sizeof(scratch), limit - total));
                u32 n = 0;
                Status s = body.read(scratch, want, &n);
                if (!is_ok(s)) {
                    return false;
                }
                if (n == 0) {
                    return body.complete();
                }
                total += n;
            }
            return true;
        }

        [[nodiscard]] std::unique_ptr<HttpBodyReader> make_body(ConnReader& reader, const BodyPlan& plan) {
            switch (plan.framing) {
                case BodyFraming::Length:
                    return std::make_unique<LengthBodyReader>(reader, plan.length);
                case BodyFraming::Chunked:
                    return std::make_unique<ChunkedBodyReader>(reader);
                case BodyFraming::None:
                    break;
            }
            return std::make_unique<EmptyBodyReader>();
        }
    } // namespace

    void serve_http_connection(Connection& conn, postsink::ingest::IngestHandler& handler) noexcept {
        if (!is_ok(conn.handshake())) {
            return;
        }

        ConnReader reader(conn);
        for (;;) {
            RequestHead head;
            u16 reject_status = 400;
            const HeadRead hr = read_head(reader, &head, &reject_status);
            if (hr == HeadRead::Closed) {
                return;
            }
            if (hr == HeadRead::Rejected) {
                reject(conn, reject_status);
                return;
            }

            postsink::ingest::Request req;
            req.method = head.method;
            req.target = head.target;
            req.proto = head.proto;
            req.remote = conn.remote();
            if (const std::string* host = find_header(head, "Host")) {
                req.host = *host;
            }
            if (const std::string* ua = find_header(head, "User-Agent")) {
                req.user_agent = *ua;
            }
            if (!is_ok(target_path(head.target, &req.path))) {
                reject(conn, 400);
                return;
            }

            BodyPlan plan;
            Status s = body_plan(head, &plan);
            if (!is_ok(s)) {
                reject(conn, s.code == StatusCode::Unsupported ? 501 : 400);
                return;
            }

            std::unique_ptr<HttpBodyReader> body = make_body(reader, plan);
            ContinueGate gate(conn, *body, plan.framing != BodyFraming::None && expects_continue(head));

            postsink::ingest::Response resp;
            handler.handle(req, gate, &resp);

            bool keep = wants_keep_alive(head);
            if (keep && !body->complete()) {
                keep = !body->failed() && !gate.withheld() && drain(*body, kMaxDrainBytes);
            }

            ConnectionHeader ch = ConnectionHeader::None;
            if (!keep) {
                ch = ConnectionHeader::Close;
            } else if (head.minor == 0) {
                ch = ConnectionHeader::KeepAlive;
            }
            const std::string wire = format_response(resp.status, std::string_view(resp.body, resp.body_len), ch);
            s = write_string(conn, wire);
            if (!is_ok(s) || !keep) {
                return;
            }
        }
    }

} // namespace postsink::http
