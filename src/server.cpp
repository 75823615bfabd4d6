#include "chatraw/server.hpp"
#include "chatraw/utils.hpp"
#include "chatraw/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <netdb.h>
#endif

namespace chatraw
{

	namespace
	{
		// Uploaded documents arrive inline as JSON
		const size_t kMaxBodyBytes = 64 * 1024 * 1024;
		const int kHeaderBufferSize = 16384;

		void close_socket(SocketType sock)
		{
#ifdef _WIN32
			closesocket(sock);
#else
			close(sock);
#endif
		}

		std::string extractClientIP(const struct sockaddr_storage &client_addr)
		{
			char clientIP[INET6_ADDRSTRLEN] = {0};
			inet_ntop(client_addr.ss_family,
					  client_addr.ss_family == AF_INET ? (void *)&(((struct sockaddr_in *)&client_addr)->sin_addr) : (void *)&(((struct sockaddr_in6 *)&client_addr)->sin6_addr),
					  clientIP, sizeof(clientIP));
			return std::string(clientIP);
		}

		// Header names are lowercased for case-insensitive lookup
		std::map<std::string, std::string> parseHeaders(const std::string &request)
		{
			std::map<std::string, std::string> headers;

			size_t start = request.find("\r\n");
			if (start == std::string::npos)
				return headers;
			start += 2;

			size_t end = request.find("\r\n\r\n", start);
			if (end == std::string::npos)
				end = request.length();

			std::istringstream headerStream(request.substr(start, end - start));
			std::string line;
			while (std::getline(headerStream, line))
			{
				line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
				if (line.empty())
					continue;

				size_t colonPos = line.find(':');
				if (colonPos == std::string::npos)
					continue;

				std::string name = line.substr(0, colonPos);
				std::string value = line.substr(colonPos + 1);
				name.erase(0, name.find_first_not_of(" \t"));
				name.erase(name.find_last_not_of(" \t") + 1);
				value.erase(0, value.find_first_not_of(" \t"));
				value.erase(value.find_last_not_of(" \t") + 1);

				std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
							   { return static_cast<char>(std::tolower(c)); });
				headers[name] = value;
			}
			return headers;
		}

		void parse_request_line(const std::string &requestLine, std::string &method, std::string &path)
		{
			size_t first = requestLine.find(' ');
			if (first == std::string::npos)
				return;
			method = requestLine.substr(0, first);
			size_t second = requestLine.find(' ', first + 1);
			if (second == std::string::npos)
				return;
			path = requestLine.substr(first + 1, second - first - 1);

			size_t query = path.find('?');
			if (query != std::string::npos)
				path.erase(query);
		}
	}

	Server::Server(const std::string &port, const std::string &host) : port(port), host(host), running(false)
	{
#ifdef _WIN32
		listen_sock = INVALID_SOCKET;
#else
		listen_sock = -1;
#endif
	}

	Server::~Server()
	{
		stop();
		waitForConnections();
#ifdef _WIN32
		if (listen_sock != INVALID_SOCKET)
			closesocket(listen_sock);
		WSACleanup();
#else
		if (listen_sock != -1)
			close(listen_sock);
#endif
	}

	bool Server::init()
	{
#ifdef _WIN32
		WSADATA wsaData;
		if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0)
		{
			ServerLogger::logError("WSAStartup failed");
			return false;
		}
#endif

		struct addrinfo hints, *servinfo, *p;
		std::memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_INET;
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		const char *bind_host = (host == "0.0.0.0") ? NULL : host.c_str();
		int rv = getaddrinfo(bind_host, port.c_str(), &hints, &servinfo);
		if (rv != 0)
		{
#ifdef _WIN32
			ServerLogger::logError("getaddrinfo: %s", gai_strerrorA(rv));
#else
			ServerLogger::logError("getaddrinfo: %s", gai_strerror(rv));
#endif
			return false;
		}

		for (p = servinfo; p != nullptr; p = p->ai_next)
		{
			listen_sock = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
#ifdef _WIN32
			if (listen_sock == INVALID_SOCKET)
				continue;
#else
			if (listen_sock == -1)
				continue;
#endif

			int yes = 1;
			if (setsockopt(listen_sock, SOL_SOCKET, SO_REUSEADDR,
						   reinterpret_cast<const char *>(&yes), sizeof(yes)) == -1 ||
				bind(listen_sock, p->ai_addr, static_cast<int>(p->ai_addrlen)) == -1)
			{
				close_socket(listen_sock);
#ifdef _WIN32
				listen_sock = INVALID_SOCKET;
#else
				listen_sock = -1;
#endif
				continue;
			}
			break;
		}
		freeaddrinfo(servinfo);

		if (p == nullptr)
		{
			ServerLogger::logError("Failed to bind %s:%s", host.c_str(), port.c_str());
			return false;
		}

		if (listen(listen_sock, SOMAXCONN) == -1)
		{
			ServerLogger::logError("Listen failed");
			return false;
		}

		// Port "0" lets the system pick one; report the port actually bound
		struct sockaddr_storage bound;
#ifdef _WIN32
		int bound_len = sizeof(bound);
#else
		socklen_t bound_len = sizeof(bound);
#endif
		if (getsockname(listen_sock, reinterpret_cast<struct sockaddr *>(&bound), &bound_len) == 0)
		{
			if (bound.ss_family == AF_INET)
				port = std::to_string(ntohs(reinterpret_cast<struct sockaddr_in *>(&bound)->sin_port));
			else if (bound.ss_family == AF_INET6)
				port = std::to_string(ntohs(reinterpret_cast<struct sockaddr_in6 *>(&bound)->sin6_port));
		}

		ServerLogger::logInfo("Server initialized and listening on %s:%s", host.c_str(), port.c_str());
		return true;
	}

	void Server::addRoute(std::unique_ptr<IRoute> route)
	{
		routes.push_back(std::move(route));
	}

	void Server::run()
	{
		running = true;
		ServerLogger::logInfo("Server entering main loop");

		while (running)
		{
			struct sockaddr_storage client_addr;
#ifdef _WIN32
			int sin_size = sizeof(client_addr);
#else
			socklen_t sin_size = sizeof(client_addr);
#endif

			// Wake up every second to notice stop()
			fd_set readfds;
			FD_ZERO(&readfds);
			FD_SET(listen_sock, &readfds);

			struct timeval tv;
			tv.tv_sec = 1;
			tv.tv_usec = 0;

			int select_result = select(static_cast<int>(listen_sock) + 1, &readfds, NULL, NULL, &tv);
			if (select_result == -1)
			{
				if (!running)
					break;
				ServerLogger::logError("Select failed");
				break;
			}
			if (select_result == 0 || !FD_ISSET(listen_sock, &readfds))
				continue;

			SocketType client_sock = accept(listen_sock, reinterpret_cast<struct sockaddr *>(&client_addr), &sin_size);
#ifdef _WIN32
			if (client_sock == INVALID_SOCKET)
#else
			if (client_sock == -1)
#endif
			{
				ServerLogger::logError("Accept failed");
				continue;
			}

			std::string clientIP = extractClientIP(client_addr);
			ServerLogger::logDebug("New client connection from %s", clientIP.c_str());

			{
				std::lock_guard<std::mutex> lock(connections_mutex);
				++active_connections;
			}
			std::thread([this, client_sock, clientIP]()
						{
							handleConnection(client_sock, clientIP);
							close_socket(client_sock);
							std::lock_guard<std::mutex> lock(connections_mutex);
							if (--active_connections == 0)
								connections_done.notify_all(); })
				.detach();
		}

		ServerLogger::logInfo("Server main loop exited");
	}

	void Server::handleConnection(SocketType client_sock, const std::string &clientIP)
	{
		// Generous receive timeout; uploads can be large
		struct timeval timeout;
		timeout.tv_sec = 30;
		timeout.tv_usec = 0;
		setsockopt(client_sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout, sizeof(timeout));

		std::string request;
		char buffer[kHeaderBufferSize];
		while (request.find("\r\n\r\n") == std::string::npos && request.size() < static_cast<size_t>(kHeaderBufferSize))
		{
			int bytesReceived = recv(client_sock, buffer, sizeof(buffer), 0);
			if (bytesReceived <= 0)
				break;
			request.append(buffer, bytesReceived);
		}

		if (request.empty())
		{
			ServerLogger::logDebug("No data received from %s", clientIP.c_str());
			return;
		}

		size_t headerEnd = request.find("\r\n\r\n");
		size_t endOfLine = request.find("\r\n");
		if (headerEnd == std::string::npos || endOfLine == std::string::npos)
		{
			ServerLogger::logWarning("Malformed request received from %s", clientIP.c_str());
			send_response(client_sock, 400, make_error_body("Bad Request", "invalid_request_error").dump());
			return;
		}

		std::string method, path;
		parse_request_line(request.substr(0, endOfLine), method, path);
		auto headers = parseHeaders(request);

		ServerLogger::logInfo("Processing %s request for %s from %s", method.c_str(), path.c_str(), clientIP.c_str());

		if (method == "OPTIONS")
		{
			send_response(client_sock, 204, "",
						  {{"Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS"},
						   {"Access-Control-Allow-Headers", "Content-Type, Authorization"}});
			return;
		}

		size_t contentLength = 0;
		auto it = headers.find("content-length");
		if (it != headers.end())
		{
			try
			{
				contentLength = static_cast<size_t>(std::stoull(it->second));
			}
			catch (const std::exception &)
			{
				ServerLogger::logWarning("Invalid Content-Length header: %s", it->second.c_str());
				send_response(client_sock, 400, make_error_body("Invalid Content-Length", "invalid_request_error").dump());
				return;
			}
		}

		if (contentLength > kMaxBodyBytes)
		{
			send_response(client_sock, 413, make_error_body("Request body too large", "invalid_request_error").dump());
			return;
		}

		std::string body = request.substr(headerEnd + 4);
		if (body.size() < contentLength)
		{
			std::vector<char> bodyBuffer(contentLength - body.size());
			size_t totalRead = 0;
			while (totalRead < bodyBuffer.size())
			{
				int bytesRead = recv(client_sock, bodyBuffer.data() + totalRead, static_cast<int>(bodyBuffer.size() - totalRead), 0);
				if (bytesRead <= 0)
					break;
				totalRead += static_cast<size_t>(bytesRead);
			}
			body.append(bodyBuffer.data(), totalRead);

			if (body.size() < contentLength)
			{
				ServerLogger::logWarning("Incomplete body from %s (%zu of %zu bytes)", clientIP.c_str(), body.size(), contentLength);
				send_response(client_sock, 400, make_error_body("Incomplete request body", "invalid_request_error").dump());
				return;
			}
		}
		else if (body.size() > contentLength)
		{
			body.resize(contentLength);
		}

		for (auto &route : routes)
		{
			if (!route->match(method, path))
				continue;

			try
			{
				route->handle(client_sock, body);
			}
			catch (const std::exception &ex)
			{
				ServerLogger::logError("Error in route handler for %s %s: %s", method.c_str(), path.c_str(), ex.what());
				send_response(client_sock, 500,
							  make_error_body(std::string("Internal error: ") + ex.what(), "server_error")
								  .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
			}
			ServerLogger::logDebug("Completed request for %s", path.c_str());
			return;
		}

		ServerLogger::logWarning("No route found for %s %s", method.c_str(), path.c_str());
		send_response(client_sock, 404, make_error_body("Not found", "invalid_request_error").dump());
	}

	void Server::stop()
	{
		if (running)
		{
			ServerLogger::logInfo("Stopping server");
			running = false;
		}
	}

	void Server::waitForConnections()
	{
		std::unique_lock<std::mutex> lock(connections_mutex);
		if (active_connections > 0)
		{
			ServerLogger::logInfo("Waiting for %zu open connections", active_connections);
		}
		connections_done.wait(lock, [this]()
							  { return active_connections == 0; });
	}

	size_t Server::activeConnections() const
	{
		std::lock_guard<std::mutex> lock(connections_mutex);
		return active_connections;
	}

} // namespace chatraw
