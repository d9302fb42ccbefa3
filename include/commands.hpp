/**
 * @page mcumgr-commands mcumgr Commands Layer
 * @file commands.hpp
 * @brief Command catalogue, request-body builders and response rendering.
 *
 * @details
 * PURPOSE
 * -------
 * A device's management agent organises its commands as (group, id) pairs.
 * This file names the groups and the commands the host uses, builds the CBOR
 * bodies for them, and renders replies as one-line `key=value` summaries for
 * shells and logs.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **mcumgr/client.hpp**: sends a (op, group, id, body) request and returns a
 *   typed Response. Builders here only fill the body.
 * - **mcumgr/file_download.hpp, file_upload.hpp, image_upload.hpp**: the
 *   chunked transfer commands; they call the `make_*` builders per chunk.
 * - **cli/main.cpp**: prints `decode_pretty()` output.
 *
 * EXAMPLE FLOW
 * ------------
 *   Request: make_echo("hi")          -> {"d": "hi"}
 *   Client:  execute(Write, GROUP_DEFAULT, DEFAULT_ECHO, body)
 *   Device:  replies {"r": "hi"}
 *   Host:    decode_pretty() -> "status=ok seq=0 group=0 id=0 r=hi"
 *
 * MAINTENANCE
 * -----------
 * - Group and command numbers are part of the wire contract. Append, never renumber.
 * - Keep decode_pretty() output stable; scripts grep it.
 */
#pragma once

#include <string>
#include <cstdint>
#include "mcumgr/client.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/response.hpp"

namespace mcumgr {

// =============================== Groups ==============================
enum : uint16_t {
    GROUP_DEFAULT = 0,   /**< OS: echo, reset, task stats. */
    GROUP_IMAGE   = 1,   /**< Firmware image slots. */
    GROUP_STATS   = 2,
    GROUP_CONFIG  = 3,
    GROUP_LOGS    = 4,
    GROUP_CRASH   = 5,
    GROUP_SPLIT   = 6,
    GROUP_RUN     = 7,
    GROUP_FS      = 8,   /**< File system: file download/upload. */
    GROUP_SHELL   = 9,
    GROUP_PER_USER = 64  /**< First application-defined group. */
};

// ============================ Command ids ============================
enum : uint8_t {
    DEFAULT_ECHO  = 0,   /**< {"d": text} -> {"r": text} */
    DEFAULT_RESET = 5,   /**< no body; device reboots after replying */

    IMAGE_STATE   = 0,
    IMAGE_UPLOAD  = 1,   /**< chunked write into an image slot */

    FS_FILE       = 0    /**< read = download chunk, write = upload chunk */
};

/// Body of an echo request.
Document make_echo(const std::string& text);

/// Body of one file download request: {"name", "off"}.
Document make_fs_download(const std::string& name, uint32_t off);

/**
 * @brief Body of one file upload request.
 * @param total Full file length; only sent with the first chunk (off == 0).
 */
Document make_fs_upload(const std::string& name, uint32_t off,
                        const uint8_t* data, std::size_t n, uint32_t total);

/// Body of one image upload request; `len` only with the first chunk.
Document make_image_upload(uint8_t image, uint32_t off,
                           const uint8_t* data, std::size_t n, uint32_t total);

/// Echo @p text through the device; the reply text lands in @p reply.
Error echo(Client& client, const std::string& text, std::string& reply);

/// Ask the device to reboot.
Error reset(Client& client);

/**
 * @brief One-line `key=value` rendering of a reply.
 *
 * "status=ok|error seq=N group=G id=I [rc=<name>] [coap=205] key=value..."
 * Byte strings print as "<N bytes>", nested maps as compact JSON.
 */
std::string decode_pretty(const Response& rsp);

} // namespace mcumgr
