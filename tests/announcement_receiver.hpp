//
// announcement_receiver.hpp
// ~~~~~~~~~~~~~~~~~~~~~~~~~
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANBEACON_TESTS_ANNOUNCEMENT_RECEIVER_HPP_INCLUDED
#define LANBEACON_TESTS_ANNOUNCEMENT_RECEIVER_HPP_INCLUDED

#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <lanbeacon/networking/diagnostic_sink.hpp>

namespace lanbeacon {
namespace tests {

/*!
* Minimal stand-in for a discovery client: records every datagram that arrives on
* listen_address:listen_port together with its sender.
* */
class announcement_receiver
{
  public:
	struct datagram
	{
		std::string payload;
		boost::asio::ip::udp::endpoint sender;
		std::chrono::steady_clock::time_point received_at;
	};

	announcement_receiver(
		boost::asio::io_service& io_service,
		const unsigned short listen_port,
		const boost::asio::ip::address& listen_address = boost::asio::ip::address::from_string("127.0.0.1")
	)
		: socket_(io_service)
	{
		boost::asio::ip::udp::endpoint listen_endpoint(listen_address, listen_port);
		socket_.open(listen_endpoint.protocol());
		socket_.set_option(boost::asio::ip::udp::socket::reuse_address(true));
		socket_.bind(listen_endpoint);

		start_receive();
	}

	const std::vector<datagram>& received() const
	{
		return received_;
	}

  private:
	void start_receive()
	{
		// first do a receive with null_buffers to determine the size
		socket_.async_receive(boost::asio::null_buffers(),
			[this](const boost::system::error_code& error, std::size_t)
			{
				if (error)
				{
					if (error != boost::asio::error::operation_aborted)
						std::cerr << error.message() << std::endl;
					return;
				}

				auto receive_buffer = std::make_shared<std::vector<char>>(socket_.available());
				auto sender_endpoint = std::make_shared<boost::asio::ip::udp::endpoint>();

				socket_.async_receive_from(
					boost::asio::buffer(receive_buffer->data(), receive_buffer->size()), *sender_endpoint,
					[this, receive_buffer, sender_endpoint]
						(const boost::system::error_code& error, std::size_t bytes_recvd)
					{
						if (error)
						{
							if (error != boost::asio::error::operation_aborted)
								std::cerr << error.message() << std::endl;
							return;
						}

						received_.push_back(datagram{
							{receive_buffer->data(), receive_buffer->data() + bytes_recvd},
							*sender_endpoint,
							std::chrono::steady_clock::now()
						});
						start_receive();
					});
			});
	}

	boost::asio::ip::udp::socket socket_;
	std::vector<datagram> received_;
};

/*!
* diagnostic_sink that remembers everything instead of printing it.
* Safe to share between announcers running on different threads.
* */
class recording_sink : public networking::diagnostic_sink
{
  public:
	recording_sink()
		: started_(0)
		, stopped_(0)
	{
	}

	void on_started(
		const boost::asio::ip::udp::endpoint& local_endpoint,
		const boost::asio::ip::udp::endpoint&,
		std::chrono::steady_clock::duration) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		++started_;
		local_endpoints_.push_back(local_endpoint);
	}

	void on_sent(std::size_t tick, std::size_t bytes_transferred) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		sent_ticks_.push_back(tick);
		sent_bytes_.push_back(bytes_transferred);
	}

	void on_send_error(const networking::send_error& error) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		send_errors_.push_back(error);
	}

	void on_error(const char* what, const boost::system::error_code& error) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		other_errors_.push_back(std::string(what) + ": " + error.message());
	}

	void on_stopped(const boost::asio::ip::udp::endpoint&) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		++stopped_;
	}

	std::size_t started() const { std::lock_guard<std::mutex> lock(mutex_); return started_; }
	std::size_t stopped() const { std::lock_guard<std::mutex> lock(mutex_); return stopped_; }
	std::vector<boost::asio::ip::udp::endpoint> local_endpoints() const { std::lock_guard<std::mutex> lock(mutex_); return local_endpoints_; }
	std::vector<std::size_t> sent_ticks() const { std::lock_guard<std::mutex> lock(mutex_); return sent_ticks_; }
	std::vector<std::size_t> sent_bytes() const { std::lock_guard<std::mutex> lock(mutex_); return sent_bytes_; }
	std::vector<networking::send_error> send_errors() const { std::lock_guard<std::mutex> lock(mutex_); return send_errors_; }
	std::vector<std::string> other_errors() const { std::lock_guard<std::mutex> lock(mutex_); return other_errors_; }

  private:
	mutable std::mutex mutex_;
	std::size_t started_;
	std::size_t stopped_;
	std::vector<boost::asio::ip::udp::endpoint> local_endpoints_;
	std::vector<std::size_t> sent_ticks_;
	std::vector<std::size_t> sent_bytes_;
	std::vector<networking::send_error> send_errors_;
	std::vector<std::string> other_errors_;
};

}
}

#endif /* LANBEACON_TESTS_ANNOUNCEMENT_RECEIVER_HPP_INCLUDED */
