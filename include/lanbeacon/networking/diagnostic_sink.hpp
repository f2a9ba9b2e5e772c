//
// diagnostic_sink.hpp
// ~~~~~~~~~~~~~~~~~~~
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANBEACON_DIAGNOSTIC_SINK_HPP_INCLUDED
#define LANBEACON_DIAGNOSTIC_SINK_HPP_INCLUDED

#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <boost/asio.hpp>

namespace lanbeacon {
namespace networking {

/*!
* A single announcement that could not be sent.
* */
struct send_error
{
	boost::system::error_code error; ///< what the socket layer reported
	boost::asio::ip::udp::endpoint destination; ///< where the announcement should have gone
	std::size_t tick; ///< zero based sequence number of the failed tick
};

/*!
* Receives everything a service_announcer has to report.
*
* None of these calls may throw. They are invoked from within the io_service the
* announcer runs on, so keep them short.
* Only on_send_error must be implemented, the others default to doing nothing.
* */
class diagnostic_sink
{
  public:
	virtual ~diagnostic_sink()
	{
	}

	/// the socket is bound, the first announcement is about to go out
	virtual void on_started(
		const boost::asio::ip::udp::endpoint& /*local_endpoint*/,
		const boost::asio::ip::udp::endpoint& /*destination*/,
		std::chrono::steady_clock::duration /*interval*/)
	{
	}

	/// tick number tick went out
	virtual void on_sent(std::size_t /*tick*/, std::size_t /*bytes_transferred*/)
	{
	}

	/// a tick failed. The announcer carries on regardless.
	virtual void on_send_error(const send_error& error) = 0;

	/// something other than a send went wrong, i.e. the timer or closing the socket
	virtual void on_error(const char* /*what*/, const boost::system::error_code& /*error*/)
	{
	}

	virtual void on_stopped(const boost::asio::ip::udp::endpoint& /*destination*/)
	{
	}
};

/*!
* The default sink: informational messages go to std::clog, errors to std::cerr.
* Successful sends are not reported, there would be one line every interval.
* */
class ostream_diagnostic_sink : public diagnostic_sink
{
  public:
	ostream_diagnostic_sink(std::ostream& info = std::clog, std::ostream& errors = std::cerr)
		: info_(info)
		, errors_(errors)
	{
	}

	void on_started(
		const boost::asio::ip::udp::endpoint& local_endpoint,
		const boost::asio::ip::udp::endpoint& destination,
		std::chrono::steady_clock::duration interval) override
	{
		info_ << "announcing on " << local_endpoint << " to " << destination << " every "
			<< std::chrono::duration_cast<std::chrono::milliseconds>(interval).count() << " ms"
			<< std::endl;
	}

	void on_send_error(const send_error& error) override
	{
		errors_ << "broadcast error: " << error.error.message()
			<< " (tick " << error.tick << ", to " << error.destination << ")" << std::endl;
	}

	void on_error(const char* what, const boost::system::error_code& error) override
	{
		errors_ << what << ": " << error.message() << std::endl;
	}

	void on_stopped(const boost::asio::ip::udp::endpoint& destination) override
	{
		info_ << "stopped announcing to " << destination << std::endl;
	}

  private:
	std::ostream& info_;
	std::ostream& errors_;
};

/// the sink used by announcers that were not given one.
/// Never destroyed, so announcers with static storage duration may still report from their destructors.
inline diagnostic_sink& default_diagnostic_sink()
{
	static ostream_diagnostic_sink& sink = *new ostream_diagnostic_sink;
	return sink;
}

}
}

#endif /* LANBEACON_DIAGNOSTIC_SINK_HPP_INCLUDED */
