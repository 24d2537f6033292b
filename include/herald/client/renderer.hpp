#pragma once

#include <herald/schema/encoding/json/encoder.hpp>
#include <herald/schema/event.hpp>
#include <herald/schema/primitives.hpp>

#include <cstddef>

namespace herald::client {

/// Receiving service's limit on the `message` field, in characters.
inline constexpr std::size_t kMaxMessageLength = 8192;

/// Convert an event into the map handed to the transport.
///
/// Only fields set on the event appear in the result. Local bookkeeping
/// (`source`, `original_exception`, `attachments`) is dropped, `message` is
/// cut to kMaxMessageLength characters, records become plain maps, unset
/// request members are removed and every free-form field is sanitized with
/// `encoder`.
herald::schema::value_t render_event(
    const herald::schema::event_t& event,
    herald::schema::encoding::json_encoder_t& encoder);

herald::schema::value_t render_breadcrumb(
    const herald::schema::breadcrumb_t& breadcrumb,
    herald::schema::encoding::json_encoder_t& encoder);

herald::schema::value_t render_request(
    const herald::schema::request_t& request,
    herald::schema::encoding::json_encoder_t& encoder);

herald::schema::value_t render_exception(
    const herald::schema::exception_t& exception);

}  // namespace herald::client
