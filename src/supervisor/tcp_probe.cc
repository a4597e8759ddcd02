#include "tcp_probe.h"

#include <glog/logging.h>

namespace ClipBridge {

std::shared_ptr<TcpProbe> TcpProbe::Create(boost::asio::io_context& io,
		std::string host, int port, std::chrono::milliseconds timeout) {
	return std::shared_ptr<TcpProbe>(new TcpProbe(io, std::move(host), port, timeout));
}

TcpProbe::TcpProbe(boost::asio::io_context& io, std::string host, int port,
		std::chrono::milliseconds timeout)
	: resolver_(io),
	socket_(io),
	deadline_(io),
	host_(std::move(host)),
	port_(port),
	timeout_(timeout) {}

void TcpProbe::Start(Callback callback) {
	callback_ = std::move(callback);
	auto self = shared_from_this();

	VLOG(1) << "Probing " << host_ << ":" << port_ << " (timeout " << timeout_.count() << "ms)";

	deadline_.expires_after(timeout_);
	deadline_.async_wait([self](const boost::system::error_code& ec) {
		self->OnDeadline(ec);
	});

	resolver_.async_resolve(host_, std::to_string(port_),
			[self](const boost::system::error_code& ec,
				boost::asio::ip::tcp::resolver::results_type endpoints) {
				self->OnResolved(ec, std::move(endpoints));
			});
}

void TcpProbe::Cancel() {
	if (finished_) {
		return;
	}
	finished_ = true;
	callback_ = nullptr;
	boost::system::error_code ignored;
	resolver_.cancel();
	deadline_.cancel();
	socket_.close(ignored);
}

void TcpProbe::OnResolved(const boost::system::error_code& ec,
		boost::asio::ip::tcp::resolver::results_type endpoints) {
	if (finished_) {
		return;
	}
	if (ec) {
		LOG(WARNING) << "Probe could not resolve " << host_ << ": " << ec.message();
		Finish(false);
		return;
	}
	auto self = shared_from_this();
	boost::asio::async_connect(socket_, endpoints,
			[self](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
				self->OnConnected(ec);
			});
}

void TcpProbe::OnConnected(const boost::system::error_code& ec) {
	if (finished_) {
		return;
	}
	if (ec) {
		LOG(WARNING) << "Probe connect to " << host_ << ":" << port_ << " failed: " << ec.message();
		Finish(false);
		return;
	}
	VLOG(1) << "Probe connected to " << host_ << ":" << port_;
	Finish(true);
}

void TcpProbe::OnDeadline(const boost::system::error_code& ec) {
	if (ec == boost::asio::error::operation_aborted || finished_) {
		return;
	}
	LOG(WARNING) << "Probe to " << host_ << ":" << port_ << " timed out";
	Finish(false);
}

void TcpProbe::Finish(bool reachable) {
	finished_ = true;
	boost::system::error_code ignored;
	resolver_.cancel();
	deadline_.cancel();
	socket_.close(ignored);

	Callback callback = std::move(callback_);
	callback_ = nullptr;
	if (callback) {
		callback(reachable);
	}
}

} // namespace ClipBridge
