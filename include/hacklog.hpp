#ifndef HACKLOG_HPP
#define HACKLOG_HPP

#include "hacklog/core/config.hpp"
#include "hacklog/core/diagnostics.hpp"
#include "hacklog/core/errors.hpp"
#include "hacklog/core/log_common.hpp"
#include "hacklog/core/log_entry.hpp"
#include "hacklog/core/log_level.hpp"
#include "hacklog/core/log_stream_event.hpp"
#include "hacklog/core/stop_controller.hpp"
#include "hacklog/core/terminal.hpp"
#include "hacklog/core/time_util.hpp"
#include "hacklog/parse/compose_line.hpp"
#include "hacklog/parse/json_heuristics.hpp"
#include "hacklog/parse/line_reader.hpp"
#include "hacklog/parse/loki_line.hpp"
#include "hacklog/parse/payload_parser.hpp"
#include "hacklog/parse/selector.hpp"
#include "hacklog/parse/structured_grouper.hpp"
#include "hacklog/formatter/formatter_interface.hpp"
#include "hacklog/formatter/json_formatter.hpp"
#include "hacklog/formatter/pretty_formatter.hpp"
#include "hacklog/transport/transport_interface.hpp"
#include "hacklog/transport/stdout_transport.hpp"
#include "hacklog/sink/sink_interface.hpp"
#include "hacklog/sink/callback_sink.hpp"
#include "hacklog/sink/collector_sink.hpp"
#include "hacklog/sink/console_sink.hpp"
#include "hacklog/sink/pretty_console_sink.hpp"
#include "hacklog/stream_manager.hpp"
#include "hacklog/net/url.hpp"
#include "hacklog/net/socket.hpp"
#include "hacklog/net/http_client.hpp"
#include "hacklog/net/websocket_client.hpp"
#include "hacklog/process/subprocess.hpp"
#include "hacklog/source/log_source.hpp"
#include "hacklog/source/compose_log_source.hpp"
#include "hacklog/source/loki_client.hpp"
#include "hacklog/source/loki_log_source.hpp"
#include "hacklog/source/backend_selector.hpp"
#include "hacklog/source/log_session.hpp"
#include "hacklog/source/loki_maintenance.hpp"
#include "hacklog/cli/logs_options.hpp"

#endif // HACKLOG_HPP
