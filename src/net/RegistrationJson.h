#pragma once

#include "../registration/Roster.h"
#include <boost/beast/http/status.hpp>
#include <string>
#include <vector>

namespace registration {
struct RegistrationResult;
}

// JSON bodies and status codes for the /events routes.

std::string roster_view_json(const registration::RosterView& v);
std::string availability_json(const registration::RosterView& v);
std::string registration_error_json(registration::RegistrationError e);
// {"message":..., "event": RosterView}
std::string registration_success_json(const std::string& message, const registration::RosterView& v);
std::string event_ids_json(const std::vector<std::string>& ids);

boost::beast::http::status status_for(registration::RegistrationError e);
