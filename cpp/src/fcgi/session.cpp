#include "postsink/fcgi/session.hpp"
#include "postsink/http/message.hpp"
#include "postsink/http/parser.hpp"
#include "postsink/net/reader.hpp"
#include "postsink/core/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace postsink::fcgi {
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
        [[nodiscard]] const std::string* param(const std::vector<NameValue>& params, const char* name) noexcept {
            for (const NameValue& nv : params) {
                if (nv.name == name) {
                    return &nv.value;
                }
            }
            return nullptr;
        }

        [[nodiscard]] std::string param_or_empty(const std::vector<NameValue>& params, const char* name) {
            const std::string* v = param(params, name);
            return v != nullptr ? *v : std::string();
        }

        void append_record(std::string* out, RecordType type, u16 request_id, const char* data, u32 len) {
            RecordHeader h{};
            h.type = type;
            h.request_id = request_id;
            h.content_len = static_cast<u16>(len);
            h.padding_len = padding_for(len);

            u8 hdr[kHeaderBytes];
            (void)record_write_header(h, {hdr, sizeof(hdr)});
            out->append(reinterpret_cast<const char*>(hdr), sizeof(hdr));
            out->append(data, len);
            out->append(h.padding_len, '\0');
        }

        // A stream is a run of records ended by an empty one.
        void append_stream(std::string* out, RecordType type, u16 request_id, const std::string& payload) {
            std::size_t off = 0;
            while (off < payload.size()) {
                const u32 n = static_cast<u32>(std::min<std::size_t>(kMaxContentBytes, payload.size() - off));
                append_record(out, type, request_id, payload.data() + off, n);
                off += n;
            }
            append_record(out, type, request_id, nullptr, 0);
        }

        void append_end_request(std::string* out, u16 request_id, ProtocolStatus status) {
            u8 rec[kHeaderBytes + kEndRequestBytes];
            const u32 n = write_end_request(request_id, 0, status, {rec, sizeof(rec)});
            out->append(reinterpret_cast<const char*>(rec), n);
        }

        class Session;

        // Body of the active request: its STDIN stream.
        class StdinReader final : public postsink::ingest::BodyReader {
        public:
            explicit StdinReader(Session& session) noexcept : session_(session) {}
            [[nodiscard]] Status read(u8* buf, u32 cap, u32* got) noexcept override;

        private:
            Session& session_;
        };

        class Session {
        public:
            Session(Connection& conn, postsink::ingest::IngestHandler& handler)
                : conn_(conn), reader_(conn), handler_(handler) {}

            void run() noexcept;

            [[nodiscard]] Status read_stdin(u8* buf, u32 cap, u32* got) noexcept;

        private:
            [[nodiscard]] Status next_record(RecordHeader* h, bool* eof) noexcept;
            [[nodiscard]] Status send(const std::string& wire) noexcept;

            // Records that can arrive at any point: management records and
            // requests we cannot take on this connection. *handled is false
            // when the record belongs to the active request.
            [[nodiscard]] Status side_record(const RecordHeader& h, bool* handled) noexcept;
            [[nodiscard]] Status answer_get_values() noexcept;
            [[nodiscard]] Status end_request(u16 request_id, ProtocolStatus status) noexcept;

            [[nodiscard]] Status serve_request() noexcept;
            [[nodiscard]] Status respond(const postsink::ingest::Response& resp) noexcept;

            void protocol_error(const char* what) noexcept {
                log_printf("fcgi: %s: %s", conn_.remote(), what);
            }

            Connection& conn_;
            ConnReader reader_;
            postsink::ingest::IngestHandler& handler_;

            std::vector<u8> content_;
            u16 active_{kNullRequestId};
            bool keep_conn_{false};
            std::string params_;

            // STDIN state of the active request.
            u32 stdin_off_{0};
            bool stdin_done_{false};
            bool aborted_{false};
        };

        Status StdinReader::read(u8* buf, u32 cap, u32* got) noexcept {
            return session_.read_stdin(buf, cap, got);
        }

        Status Session::send(const std::string& wire) noexcept {
            const postsink::core::BufferView v = postsink::core::view_of(wire);
            return conn_.write_all(v.data, v.len);
        }

        Status Session::next_record(RecordHeader* h, bool* eof) noexcept {
            *eof = false;
            if (reader_.pending().len == 0) {
                u32 n = 0;
                Status s = reader_.fill(&n);
                if (!is_ok(s)) {
                    return s;
                }
                if (n == 0) {
                    *eof = true;
                    return ok_status();
                }
            }

            u8 hdr[kHeaderBytes];
            Status s = reader_.read_exact(hdr, sizeof(hdr));
            if (!is_ok(s)) {
                return s;
            }
            if (record_read_header({hdr, sizeof(hdr)}, h) != ParseResult::Ok) {
                return make_status(StatusDomain::Fcgi, StatusCode::Invalid);
            }

            content_.resize(h->content_len);
            if (h->content_len > 0) {
                s = reader_.read_exact(content_.data(), h->content_len);
                if (!is_ok(s)) {
                    return s;
                }
            }
            return reader_.skip(h->padding_len);
        }

        Status Session::end_request(u16 request_id, ProtocolStatus status) noexcept {
            std::string wire;
            append_end_request(&wire, request_id, status);
            return send(wire);
        }

        Status Session::answer_get_values() noexcept {
            std::vector<NameValue> asked;
            if (decode_name_values(postsink::core::view_of(content_), &asked) != ParseResult::Ok) {
                asked.clear();
            }

            std::string payload;
            for (const NameValue& nv : asked) {
                if (nv.name == "FCGI_MAX_CONNS") {
                    encode_name_value(nv.name, kMaxConnsValue, &payload);
                } else if (nv.name == "FCGI_MAX_REQS") {
                    encode_name_value(nv.name, kMaxReqsValue, &payload);
                } else if (nv.name == "FCGI_MPXS_CONNS") {
                    encode_name_value(nv.name, kMpxsConnsValue, &payload);
                }
            }
            if (payload.size() > kMaxContentBytes) {
                payload.resize(0);
            }

            std::string wire;
            append_record(&wire, RecordType::GetValuesResult, kNullRequestId, payload.data(), static_cast<u32>(payload.size()));
            return send(wire);
        }

        Status Session::side_record(const RecordHeader& h, bool* handled) noexcept {
            *handled = true;
            if (is_management(h)) {
                if (h.type == RecordType::GetValues) {
                    return answer_get_values();
                }
                u8 rec[kHeaderBytes + 8];
                const u32 n = write_unknown_type(static_cast<u8>(h.type), {rec, sizeof(rec)});
                return conn_.write_all(rec, n);
            }
            if (h.type == RecordType::BeginRequest && active_ != kNullRequestId) {
                return end_request(h.request_id, ProtocolStatus::CantMpxConn);
            }
            if (h.request_id != active_ || active_ == kNullRequestId) {
                // Leftovers of a finished request, or records before BEGIN_REQUEST.
                *handled = h.type != RecordType::BeginRequest;
                return ok_status();
            }
            *handled = false;
            return ok_status();
        }

        Status Session::read_stdin(u8* buf, u32 cap, u32* got) noexcept {
            if (got == nullptr) {
                return make_status(StatusDomain::Fcgi, StatusCode::Invalid);
            }
            *got = 0;
            for (;;) {
                if (aborted_) {
                    return make_status(StatusDomain::Net, StatusCode::Network, ECONNABORTED);
                }
                if (stdin_off_ < content_.size()) {
                    const u32 n = std::min<u32>(cap, static_cast<u32>(content_.size()) - stdin_off_);
                    std::memcpy(buf, content_.data() + stdin_off_, n);
                    stdin_off_ += n;
                    *got = n;
                    return ok_status();
                }
                if (stdin_done_) {
                    return ok_status();
                }

                RecordHeader h{};
                bool eof = false;
                content_.clear();
                stdin_off_ = 0;
                Status s = next_record(&h, &eof);
                if (!is_ok(s)) {
                    return s;
                }
                if (eof) {
                    return make_status(StatusDomain::Net, StatusCode::Network);
                }

                bool handled = false;
                s = side_record(h, &handled);
                if (!is_ok(s)) {
                    return s;
                }
                if (handled) {
                    content_.clear();
                    continue;
                }
                switch (h.type) {
                    case RecordType::Stdin:
                        if (h.content_len == 0) {
                            stdin_done_ = true;
                        }
                        break;
                    case RecordType::AbortRequest:
                        aborted_ = true;
                        content_.clear();
                        break;
                    default:
                        // DATA and stray PARAMS carry nothing a responder reads.
                        content_.clear();
                        break;
                }
            }
        }

        Status Session::respond(const postsink::ingest::Response& resp) noexcept {
            const bool error = resp.status >= 400;

            char status_line[64];
            std::snprintf(status_line, sizeof(status_line), "Status: %u %s\r\n",
                          static_cast<unsigned>(resp.status), postsink::http::status_reason(resp.status));

            std::string payload(status_line);
            payload.append("Content-Type: ").append(postsink::http::kPlainTextType).append("\r\n");
            if (error) {
                payload.append("X-Content-Type-Options: nosniff\r\n");
            }
            payload.append("\r\n");
            payload.append(resp.body, resp.body_len);
            if (error) {
                payload.push_back('\n');
            }

            std::string wire;
            append_stream(&wire, RecordType::Stdout, active_, payload);
            append_end_request(&wire, active_, ProtocolStatus::RequestComplete);
            return send(wire);
        }

        Status Session::serve_request() noexcept {
            std::vector<NameValue> params;
            postsink::ingest::Request req;
            postsink::ingest::Response resp;

            Status s = make_status(StatusDomain::Fcgi, StatusCode::Invalid);
            if (decode_name_values(postsink::core::view_of(params_), &params) == ParseResult::Ok) {
                s = request_from_params(params, conn_.remote(), &req);
            }
            params_.clear();

            content_.clear();
            stdin_off_ = 0;
            stdin_done_ = false;
            aborted_ = false;

            if (!is_ok(s)) {
                protocol_error("unusable request parameters");
                postsink::ingest::response_set(&resp, 400, postsink::http::status_reason(400));
            } else {
                StdinReader body(*this);
                handler_.handle(req, body, &resp);
            }

            s = respond(resp);
            active_ = kNullRequestId;
            content_.clear();
            stdin_off_ = 0;
            return s;
        }

        void Session::run() noexcept {
            for (;;) {
                RecordHeader h{};
                bool eof = false;
                Status s = next_record(&h, &eof);
                if (!is_ok(s)) {
                    if (s.domain == StatusDomain::Fcgi) {
                        protocol_error("unsupported record version");
                    }
                    return;
                }
                if (eof) {
                    return;
                }

                bool handled = false;
                s = side_record(h, &handled);
                if (!is_ok(s)) {
                    return;
                }
                if (handled) {
                    continue;
                }

                if (h.type == RecordType::BeginRequest) {
                    BeginRequest b{};
                    if (parse_begin_request(postsink::core::view_of(content_), &b) != ParseResult::Ok) {
                        protocol_error("short BEGIN_REQUEST");
                        return;
                    }
                    const bool keep = (b.flags & kKeepConn) != 0;
                    if (b.role != Role::Responder) {
                        if (!is_ok(end_request(h.request_id, ProtocolStatus::UnknownRole)) || !keep) {
                            return;
                        }
                        continue;
                    }
                    active_ = h.request_id;
                    keep_conn_ = keep;
                    params_.clear();
                    continue;
                }

                switch (h.type) {
                    case RecordType::Params:
                        if (h.content_len > 0) {
                            if (params_.size() + content_.size() > kMaxParamsBytes) {
                                protocol_error("PARAMS stream too large");
                                return;
                            }
                            params_.append(reinterpret_cast<const char*>(content_.data()), content_.size());
                            break;
                        }
                        if (!is_ok(serve_request()) || !keep_conn_) {
                            return;
                        }
                        break;
                    case RecordType::AbortRequest: {
                        const u16 id = active_;
                        active_ = kNullRequestId;
                        params_.clear();
                        if (!is_ok(end_request(id, ProtocolStatus::RequestComplete)) || !keep_conn_) {
                            return;
                        }
                        break;
                    }
                    default:
                        // STDIN before the PARAMS stream ended; nothing to do with it yet.
                        break;
                }
            }
        }
    } // namespace

    Status request_from_params(const std::vector<NameValue>& params, const char* fallback_remote,
                               postsink::ingest::Request* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Fcgi, StatusCode::Invalid);
        }
        postsink::ingest::Request req;

        req.method = param_or_empty(params, "REQUEST_METHOD");
        if (req.method.empty()) {
            return make_status(StatusDomain::Fcgi, StatusCode::Invalid);
        }

        req.target = param_or_empty(params, "REQUEST_URI");
        if (req.target.empty()) {
            req.target = param_or_empty(params, "SCRIPT_NAME") + param_or_empty(params, "PATH_INFO");
            const std::string query = param_or_empty(params, "QUERY_STRING");
            if (!query.empty()) {
                req.target.append("?").append(query);
            }
            if (req.target.empty()) {
                req.target = "/";
            }
        }
        if (!is_ok(postsink::http::target_path(req.target, &req.path))) {
            return make_status(StatusDomain::Fcgi, StatusCode::Invalid);
        }

        req.proto = param_or_empty(params, "SERVER_PROTOCOL");
        if (req.proto.empty()) {
            req.proto = "HTTP/1.1";
        }
        req.host = param_or_empty(params, "HTTP_HOST");
        req.user_agent = param_or_empty(params, "HTTP_USER_AGENT");

        const std::string addr = param_or_empty(params, "REMOTE_ADDR");
        const std::string port = param_or_empty(params, "REMOTE_PORT");
        if (addr.empty()) {
            req.remote = fallback_remote != nullptr ? fallback_remote : "";
        } else if (port.empty()) {
            req.remote = addr;
        } else if (addr.find(':') != std::string::npos) {
            req.remote = "[" + addr + "]:" + port;
        } else {
            req.remote = addr + ":" + port;
        }

        *out = std::move(req);
        return ok_status();
    }

    void serve_fcgi_connection(Connection& conn, postsink::ingest::IngestHandler& handler) noexcept {
        if (!is_ok(conn.handshake())) {
            return;
        }
        Session session(conn, handler);
        session.run();
    }

} // namespace postsink::fcgi
