#include "RegistrationJson.h"
#include "MiniJson.h"
#include <sstream>

using registration::RegistrationError;
using registration::RosterView;

static void write_counts(std::ostringstream& ss, const RosterView& v) {
    ss << "\"event_id\":\"" << json_escape_resp(v.event_id) << "\"";
    ss << ",\"status\":\"" << registration::to_string(v.status) << "\"";
    ss << ",\"max_attendees\":" << v.max_attendees;
    ss << ",\"attendee_count\":" << v.attendee_count;
    ss << ",\"available_spots\":" << v.available_spots;
    ss << ",\"is_full\":" << (v.is_full ? "true" : "false");
}

std::string roster_view_json(const RosterView& v) {
    std::ostringstream ss;
    ss << '{';
    write_counts(ss, v);
    ss << ",\"version\":" << v.version;
    ss << ",\"attendees\":[";
    for (size_t i = 0; i < v.attendees.size(); ++i) {
        const auto& a = v.attendees[i];
        if (i) ss << ',';
        ss << "{\"user_id\":\"" << json_escape_resp(a.user_id) << "\"";
        ss << ",\"registered_at\":\"" << json_escape_resp(a.registered_at) << "\"";
        ss << ",\"status\":\"" << registration::to_string(a.status) << "\"}";
    }
    ss << "]}";
    return ss.str();
}

std::string availability_json(const RosterView& v) {
    std::ostringstream ss;
    ss << '{';
    write_counts(ss, v);
    ss << '}';
    return ss.str();
}

std::string registration_error_json(RegistrationError e) {
    return std::string("{\"error\":\"") + registration::error_name(e) + "\",\"message\":\"" +
           json_escape_resp(registration::error_message(e)) + "\"}";
}

std::string registration_success_json(const std::string& message, const RosterView& v) {
    return "{\"message\":\"" + json_escape_resp(message) + "\",\"event\":" + roster_view_json(v) + "}";
}

std::string event_ids_json(const std::vector<std::string>& ids) {
    std::string out = "{\"events\":[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out += ',';
        out += '"' + json_escape_resp(ids[i]) + '"';
    }
    out += "]}";
    return out;
}

boost::beast::http::status status_for(RegistrationError e) {
    using boost::beast::http::status;
    switch (e) {
        case RegistrationError::None: return status::ok;
        case RegistrationError::NotFound: return status::not_found;
        case RegistrationError::NotAvailable:
        case RegistrationError::AlreadyRegistered:
        case RegistrationError::Full:
        case RegistrationError::NotRegistered: return status::bad_request;
        case RegistrationError::Busy:
        case RegistrationError::Unavailable: return status::service_unavailable;
    }
    return status::internal_server_error;
}
