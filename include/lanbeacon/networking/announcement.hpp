//
// announcement.hpp
// ~~~~~~~~~~~~~~~~
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANBEACON_ANNOUNCEMENT_HPP_INCLUDED
#define LANBEACON_ANNOUNCEMENT_HPP_INCLUDED

#pragma once

#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>

namespace lanbeacon {
namespace networking {

/// discriminator carried by every announcement the service_announcer sends
const char* const server_announce_type = "SERVER_ANNOUNCE";

/*!
* The record broadcast by the service_announcer.
*
* On the wire it is a single line of compact json, type first:
* @code
* {"type":"SERVER_ANNOUNCE","port":41234}
* @endcode
*
* The address of the service is not part of the record. A discovery client pairs
* port with the source address of the datagram it received.
* */
struct announcement
{
	std::string type; ///< always server_announce_type for announcements we send
	unsigned short port; ///< the port where the announced service can be reached

	bool operator==(const announcement& o) const
	{
		return std::tie(type, port) == std::tie(o.type, o.port);
	}

	bool operator!=(const announcement& o) const
	{
		return !(*this == o);
	}

	friend std::ostream& operator<<(std::ostream& os, const announcement& a)
	{
		os << a.type << " on port " << a.port;
		return os;
	}
};

/// builds the announcement for a service listening on service_port
inline announcement make_server_announcement(const unsigned short service_port)
{
	return announcement{server_announce_type, service_port};
}

/// thrown by parse_announcement when a datagram does not hold an announcement
class malformed_announcement : public std::runtime_error
{
  public:
	explicit malformed_announcement(const std::string& what)
		: std::runtime_error("malformed announcement: " + what)
	{
	}
};

/// the bytes that go on the wire for an announcement
inline std::string serialize(const announcement& a)
{
	// ordered_json, so "type" stays in front
	nlohmann::ordered_json j;
	j["type"] = a.type;
	j["port"] = a.port;
	return j.dump();
}

/*!
* parse a received datagram.
*
* Accepts any json object with a string "type" and an unsigned integer "port" that fits
* into 16 bits. Unknown members are ignored, so that later announcers may add fields.
* Does not check the value of type, compare it against server_announce_type yourself.
*
* throws malformed_announcement on anything else.
* */
inline announcement parse_announcement(const std::string& text)
{
	nlohmann::json j;

	try
	{
		j = nlohmann::json::parse(text);
	}
	catch (const nlohmann::json::parse_error& e)
	{
		throw malformed_announcement(e.what());
	}

	if (!j.is_object())
		throw malformed_announcement("not a json object: " + text);

	auto type = j.find("type");
	if (type == j.end() || !type->is_string())
		throw malformed_announcement("missing or non-string \"type\" in: " + text);

	auto port = j.find("port");
	if (port == j.end() || !port->is_number_unsigned())
		throw malformed_announcement("missing or non-integer \"port\" in: " + text);

	auto port_value = port->get<std::uint64_t>();
	if (port_value > std::numeric_limits<unsigned short>::max())
		throw malformed_announcement("port out of range in: " + text);

	return announcement{type->get<std::string>(), static_cast<unsigned short>(port_value)};
}

}
}

#endif /* LANBEACON_ANNOUNCEMENT_HPP_INCLUDED */
