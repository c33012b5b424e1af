/**
 * @file tefmem.hpp
 * @brief Header file to facilitate the inclusion of the TEF memory manager library
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once

// Include the protocol enums and status codes
#include "enums/error.hpp"
#include "enums/protocol.hpp"
// Include exception hierarchy and result type
#include "exception/tefmem_exception.hpp"
#include "template/result.hpp"
// Include text helpers
#include "interface/text_helpers.hpp"
// Include the serial port layer
#include "io/serial_port.hpp"
#include "io/real_serial_port.hpp"
#include "io/port_enumerator.hpp"
// Include the configuration model
#include "model/radio_configuration.hpp"
#include "model/skip_state.hpp"
#include "model/channel_display.hpp"
// Include the protocol handlers
#include "protocol/response_interpreter.hpp"
#include "protocol/configuration_reader.hpp"
#include "protocol/channel_writer.hpp"
// Include CSV import/export
#include "csv/channel_csv.hpp"
// Include the session
#include "pattern/session_config.hpp"
#include "pattern/callbacks.hpp"
#include "pattern/line_transport.hpp"
#include "pattern/radio_session.hpp"
