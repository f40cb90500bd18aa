#include "mudgate/gateway.hpp"
#include "mudgate/alias_engine.hpp"
#include "mudgate/command_splitter.hpp"
#include "mudgate/overloaded.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <variant>
#include <vector>

namespace mudgate {

namespace {

std::string_view trim(std::string_view text) {
    auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && space(text.front())) text.remove_prefix(1);
    while (!text.empty() && space(text.back())) text.remove_suffix(1);
    return text;
}

} // namespace

Gateway::Gateway(GatewayConfig config, UpstreamFactory upstream_factory)
    : config_(std::move(config)), upstream_factory_(std::move(upstream_factory)) {}

Gateway::~Gateway() {
    shutdown();
}

SessionId Gateway::open_session(SendFn send) {
    const SessionId id = next_id_++;
    auto session = std::make_unique<Session>(
        id, std::move(send), LoopGuard(config_.loop_guard_threshold, config_.loop_guard_window),
        config_.max_line_bytes);
    auto& s = *session;
    sessions_.emplace(id, std::move(session));

    if (config_.debug) {
        std::cout << "[Gateway] New connection: " << id << ". Total sessions: " << sessions_.size() << std::endl;
    }

    s.send(system_message("Welcome to MudGate! Connecting to " + config_.mud_address() + "..."));
    dial(s);
    return id;
}

void Gateway::close_session(SessionId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;

    it->second->close_upstream();
    sessions_.erase(it);

    if (config_.debug) {
        std::cout << "[Gateway] Connection " << id << " closed. Total sessions: " << sessions_.size() << std::endl;
    }
}

void Gateway::shutdown() {
    for (auto& [id, session] : sessions_) {
        session->close_upstream();
    }
    sessions_.clear();
}

const Session* Gateway::find_session(SessionId id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

Session* Gateway::find(SessionId id) {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

void Gateway::dial(Session& session) {
    auto upstream = upstream_factory_(session.id());
    if (!upstream) {
        session.close_upstream();
        session.send(error_message("Failed to connect to MUD: no upstream available"));
        return;
    }

    const auto serial = session.attach_upstream(upstream);
    const auto id = session.id();
    upstream->dial(config_.mud_host, std::to_string(config_.mud_port),
        [this, id, serial](beast::error_code ec) {
            on_dial(id, serial, ec);
        });
}

void Gateway::on_dial(SessionId id, std::uint64_t serial, beast::error_code ec) {
    auto* session = find(id);
    // 会话已关闭，或者这次拨号已经被reconnect/disconnect取代
    if (!session || session->dial_serial() != serial || session->state() != SessionState::Connecting) {
        return;
    }

    if (ec) {
        session->close_upstream();
        session->send(error_message("Failed to connect to MUD: " + ec.message()));
        if (config_.debug) {
            std::cout << "[Gateway] Dial failed for connection " << id << ": " << ec.message() << std::endl;
        }
        return;
    }

    session->mark_open();
    session->send(system_message("Connected to " + config_.mud_address() + "!"));
    if (config_.debug) {
        std::cout << "[Gateway] MUD connection established for connection " << id << std::endl;
    }
}

void Gateway::handle_message(SessionId id, std::string_view text) {
    auto* session = find(id);
    if (!session) return;

    auto message = parse_client_message(text);
    if (!message) {
        if (config_.debug) {
            std::cout << "[Gateway] Ignoring unroutable message from connection " << id << std::endl;
        }
        return;
    }

    auto& s = *session;
    std::visit(overloaded{
        [&](const CommandMessage& m) {
            handle_command(s, m.command);
        },
        [&](SetTriggersMessage& m) {
            if (config_.debug) {
                const auto invalid = std::count_if(m.triggers.begin(), m.triggers.end(),
                    [](const Trigger& t) { return !t.pattern.valid(); });
                std::cout << "[Gateway] Connection " << id << " installed " << m.triggers.size()
                          << " triggers (" << invalid << " with invalid patterns)" << std::endl;
            }
            s.set_triggers(std::move(m.triggers));
        },
        [&](SetAliasesMessage& m) {
            s.set_aliases(std::move(m.aliases));
        },
        [&](const SetTickersMessage& m) {
            s.set_tickers(m.tickers, Clock::now());
            if (config_.debug) {
                std::cout << "[Gateway] Connection " << id << " tickers updated: " << s.ticker_count()
                          << " active out of " << m.tickers.size() << std::endl;
            }
        },
        [&](const KeepaliveMessage&) {
            s.send(keepalive_ack_message());
        },
        [&](const HealthCheckMessage&) {
            s.send(health_ok_message());
        },
        [&](const ReconnectMessage&) {
            reconnect(s);
        },
        [&](const DisconnectMessage&) {
            disconnect(s);
        },
        [&](const TestLineMessage& m) {
            handle_test_line(s, m.line);
        },
    }, *message);
}

void Gateway::handle_command(Session& session, std::string_view command) {
    if (session.state() != SessionState::Open || !session.upstream()) {
        session.send(error_message("Not connected to MUD"));
        return;
    }

    const auto expanded = apply_alias(command, session.aliases());
    for (const auto& part : split_commands(expanded, config_.command_separator)) {
        const auto cmd = trim(part);
        if (cmd.empty()) continue;

        std::string line(cmd);
        line += "\r\n";
        session.upstream()->write(std::move(line));
    }
}

void Gateway::handle_test_line(Session& session, const std::string& line) {
    process_line(session, line, Clock::now(), true);
}

void Gateway::process_line(Session& session, const std::string& line, Clock::time_point now, bool test) {
    const auto evaluation = evaluate_triggers(line, session.triggers(), &session.loop_guard(), now);

    for (const auto& trigger_id : evaluation.looping) {
        if (!session.disable_trigger(trigger_id)) continue;

        std::string name = trigger_id;
        for (const auto& trigger : session.triggers()) {
            if (trigger.id == trigger_id) {
                name = trigger.name.empty() ? trigger.pattern.text() : trigger.name;
                break;
            }
        }
        std::cerr << "[Gateway] Connection " << session.id() << " trigger loop detected: " << name << std::endl;
        session.send(system_message(
            "Loop detected! Trigger \"" + name + "\" fired too many times and has been disabled."));
        session.send(disable_trigger_message(trigger_id));
    }

    if (test || !evaluation.suppressed) {
        session.send(mud_message(evaluation, test));
    }

    for (const auto& command : evaluation.commands) {
        handle_command(session, command);
    }
}

void Gateway::reconnect(Session& session) {
    session.close_upstream();
    session.send(system_message("Reconnecting to " + config_.mud_address() + "..."));
    if (config_.debug) std::cout << "[Gateway] Reconnect requested by connection " << session.id() << std::endl;
    dial(session);
}

void Gateway::disconnect(Session& session) {
    session.close_upstream();
    session.send(system_message("Disconnected from MUD."));
    if (config_.debug) std::cout << "[Gateway] Explicit disconnect by connection " << session.id() << std::endl;
}

void Gateway::lose_upstream(Session& session, beast::error_code ec) {
    session.close_upstream();

    if (ec == net::error::eof) {
        session.send(system_message("Connection to MUD lost."));
    } else {
        session.send(system_message("Connection to MUD lost: " + ec.message()));
    }

    if (config_.debug) {
        std::cout << "[Gateway] Upstream lost for connection " << session.id() << ": " << ec.message() << std::endl;
    }
}

void Gateway::tick() {
    tick(Clock::now());
}

void Gateway::tick(Clock::time_point now) {
    std::vector<SessionId> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }

    for (auto id : ids) {
        if (auto* session = find(id)) {
            tick_session(*session, now);
        }
    }
}

void Gateway::tick_session(Session& session, Clock::time_point now) {
    if (session.state() == SessionState::Open && session.upstream()) {
        std::string data;
        beast::error_code ec;
        session.upstream()->read_some(data, config_.max_read_bytes_per_tick, ec);

        std::vector<std::string> lines;
        if (!data.empty()) {
            lines = session.receive(data, now);
        }

        if (ec) {
            // 断开前把已经收到的内容(包括残行)全部送出
            for (auto& line : session.flush()) {
                lines.push_back(std::move(line));
            }
        } else {
            for (auto& line : session.flush_stale(now, config_.prompt_flush)) {
                lines.push_back(std::move(line));
            }
        }

        for (const auto& line : lines) {
            process_line(session, line, now);
        }

        if (ec) {
            lose_upstream(session, ec);
        }
    }

    // 定时器在断线期间照常推进，只是命令被丢弃
    const auto due = session.due_tickers(now);
    if (session.state() == SessionState::Open) {
        for (const auto& command : due) {
            handle_command(session, command);
        }
    }
}

} // namespace mudgate
