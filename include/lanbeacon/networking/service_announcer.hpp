//
// service_announcer.hpp
// ~~~~~~~~~~~~~~~~~~~~~
//
// Copyright (c) 2015 Benjamin Schulz (beschulz at betabugs dot de)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANBEACON_SERVICE_ANNOUNCER_HPP_INCLUDED
#define LANBEACON_SERVICE_ANNOUNCER_HPP_INCLUDED

#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include "announcement.hpp"
#include "diagnostic_sink.hpp"

namespace lanbeacon {
namespace networking {

/// thrown by service_announcer::start() if the socket could not be set up
class bind_error : public boost::system::system_error
{
  public:
	explicit bind_error(const boost::system::error_code& error)
		: boost::system::system_error(error, "unable to start announcer")
	{
	}
};

/*!
* class to announce a service on the local network segment via udp broadcast, so that
* clients can find it without knowing its address.
*
* Every interval, a constant announcement (see announcement.hpp) is sent to
* broadcast_address:broadcast_port. The first one goes out right after start().
* Sending is best effort: failures are handed to the diagnostic_sink and the next tick
* happens on schedule anyway.
*
* example:
* @code
* boost::asio::io_service io_service;
*
* service_announcer announcer(io_service, 8080);
* announcer.start();
*
* io_service.run();
* @endcode
*
* The sink must outlive the announcer.
* Not thread safe, use it from the thread(s) running io_service only.
* */
class service_announcer
{
  public:
	enum class state
	{
		unbound, ///< constructed, start() not called yet or failed
		announcing, ///< socket bound, schedule running
		stopped ///< stop() was called, there is no way back
	};

	/*!
	* announce service_port in interval intervals.
	* Note, that it is not required, that the service actually listens on service_port and that
	* there is no coupling between the announcer and your service.
	* */
	service_announcer(
		boost::asio::io_service& io_service, ///< io_service to use
		const unsigned short service_port, ///< the port where the service listens on
		diagnostic_sink& sink = default_diagnostic_sink(), ///< gets told about sends and failures
		const std::chrono::steady_clock::duration interval = std::chrono::milliseconds(3000), ///< time between two announcements
		const unsigned short broadcast_port = 41234, ///< the port this udp broadcast sender sends to
		const boost::asio::ip::address& broadcast_address = boost::asio::ip::address::from_string("255.255.255.255"), ///< destination, the limited broadcast address by default
		const bool enable_broadcast = true ///< set SO_BROADCAST. Only ever disable this to exercise failure handling
	)
		: destination_(broadcast_address, broadcast_port)
		, socket_(io_service)
		, timer_(io_service)
		, announcement_(make_server_announcement(service_port))
		, payload_(serialize(announcement_))
		, sink_(sink)
		, interval_(interval)
		, enable_broadcast_(enable_broadcast)
		, state_(state::unbound)
		, ticks_(0)
	{
		if (interval_ <= std::chrono::steady_clock::duration::zero())
		{
			throw std::invalid_argument("announce interval must be positive");
		}
	}

	~service_announcer()
	{
		stop();
	}

	/// like start(boost::system::error_code&), but throws bind_error
	void start()
	{
		boost::system::error_code error;
		start(error);

		if (error)
		{
			throw bind_error(error);
		}
	}

	/*!
	* bind a socket to an ephemeral port, enable broadcasting and start announcing.
	*
	* On failure, the announcer stays unbound and start may be retried.
	* Fails with already_started while announcing and with shut_down after stop().
	* */
	void start(boost::system::error_code& error)
	{
		error = boost::system::error_code();

		if (state_ == state::announcing)
		{
			error = boost::asio::error::already_started;
			return;
		}

		if (state_ == state::stopped)
		{
			error = boost::asio::error::shut_down;
			return;
		}

		socket_.open(destination_.protocol(), error);

		if (!error)
			socket_.set_option(boost::asio::socket_base::broadcast(enable_broadcast_), error);

		if (!error)
			socket_.bind(boost::asio::ip::udp::endpoint(destination_.protocol(), 0), error);

		if (!error)
			local_endpoint_ = socket_.local_endpoint(error);

		if (error)
		{
			close_socket();
			return;
		}

		state_ = state::announcing;
		alive_ = std::make_shared<char>();
		sink_.on_started(local_endpoint_, destination_, interval_);

		next_tick_ = std::chrono::steady_clock::now();
		wait_for_next_tick();
	}

	/*!
	* stop announcing, cancel the timer and release the socket.
	* Can be called any number of times, the destructor calls it as well.
	* */
	void stop()
	{
		if (state_ == state::stopped)
			return;

		const bool was_announcing = state_ == state::announcing;
		state_ = state::stopped;

		// pending handlers check this and bail out
		alive_.reset();

		boost::system::error_code error;
		timer_.cancel(error);
		if (error)
		{
			sink_.on_error("timer error", error);
		}

		close_socket();

		if (was_announcing)
		{
			sink_.on_stopped(destination_);
		}
	}

	state current_state() const
	{
		return state_;
	}

	/// the ephemeral endpoint we send from. Only meaningful while announcing.
	const boost::asio::ip::udp::endpoint& local_endpoint() const
	{
		return local_endpoint_;
	}

	const boost::asio::ip::udp::endpoint& destination() const
	{
		return destination_;
	}

	std::chrono::steady_clock::duration interval() const
	{
		return interval_;
	}

	const announcement& announced() const
	{
		return announcement_;
	}

	/// the exact bytes of every datagram
	const std::string& payload() const
	{
		return payload_;
	}

  private:
	void wait_for_next_tick()
	{
		std::weak_ptr<char> alive = alive_;

		timer_.expires_at(next_tick_);
		timer_.async_wait(
			[this, alive](const boost::system::error_code& error)
			{
				// the announcer may be gone already, don't touch this unless it's still alive
				if (alive.expired())
					return;

				this->handle_timeout(error);
			});
	}

	void handle_timeout(const boost::system::error_code& error)
	{
		if (error)
		{
			if (error != boost::asio::error::operation_aborted)
			{
				sink_.on_error("timer error", error);
			}
			return;
		}

		// the sink may stop or even destroy us from within tick()
		std::weak_ptr<char> alive = alive_;
		tick();
		if (alive.expired())
			return;

		// stay on the grid next_tick_ started on. If we fell behind by more than an
		// interval, skip the ticks we missed instead of sending a burst.
		const auto now = std::chrono::steady_clock::now();
		next_tick_ += interval_;
		if (next_tick_ < now)
		{
			next_tick_ += ((now - next_tick_) / interval_ + 1) * interval_;
		}

		wait_for_next_tick();
	}

	void tick()
	{
		const std::size_t tick = ticks_++;

		boost::system::error_code error;
		const std::size_t bytes_transferred =
			socket_.send_to(boost::asio::buffer(payload_), destination_, 0, error);

		if (error)
		{
			sink_.on_send_error(send_error{error, destination_, tick});
		}
		else
		{
			sink_.on_sent(tick, bytes_transferred);
		}
	}

	void close_socket()
	{
		if (!socket_.is_open())
			return;

		boost::system::error_code error;
		socket_.close(error);
		if (error)
		{
			sink_.on_error("teardown error", error);
		}
	}

  private:
	const boost::asio::ip::udp::endpoint destination_;
	boost::asio::ip::udp::socket socket_;
	boost::asio::steady_timer timer_;
	const announcement announcement_;
	const std::string payload_;
	diagnostic_sink& sink_;
	const std::chrono::steady_clock::duration interval_;
	const bool enable_broadcast_;

	state state_;
	boost::asio::ip::udp::endpoint local_endpoint_;
	std::chrono::steady_clock::time_point next_tick_;
	std::size_t ticks_;
	std::shared_ptr<char> alive_;
};

}
}

#endif /* LANBEACON_SERVICE_ANNOUNCER_HPP_INCLUDED */
