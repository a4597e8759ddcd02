#ifndef CLIPBRIDGE_SUPERVISOR_TCP_PROBE_H_
#define CLIPBRIDGE_SUPERVISOR_TCP_PROBE_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>

namespace ClipBridge {

/**
 * One-shot TCP connect check against host:port.
 *
 * The callback runs exactly once on the io_context: true if the connection
 * was established before the deadline, false on refusal, resolution failure
 * or timeout. Cancel() suppresses the callback entirely.
 */
class TcpProbe : public std::enable_shared_from_this<TcpProbe> {
public:
	using Callback = std::function<void(bool reachable)>;

	static std::shared_ptr<TcpProbe> Create(boost::asio::io_context& io,
			std::string host, int port, std::chrono::milliseconds timeout);

	void Start(Callback callback);

	/// Abort an in-flight probe. The callback is not invoked afterwards.
	void Cancel();

	bool finished() const { return finished_; }

private:
	TcpProbe(boost::asio::io_context& io, std::string host, int port,
			std::chrono::milliseconds timeout);

	void OnResolved(const boost::system::error_code& ec,
			boost::asio::ip::tcp::resolver::results_type endpoints);
	void OnConnected(const boost::system::error_code& ec);
	void OnDeadline(const boost::system::error_code& ec);
	void Finish(bool reachable);

	boost::asio::ip::tcp::resolver resolver_;
	boost::asio::ip::tcp::socket socket_;
	boost::asio::steady_timer deadline_;
	std::string host_;
	int port_;
	std::chrono::milliseconds timeout_;
	Callback callback_;
	bool finished_ = false;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_TCP_PROBE_H_
