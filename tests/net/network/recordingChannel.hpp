#pragma once

#include "network/connectionRegistry.hpp"
#include "network/messages.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace gomoku::gtest {

//! Outbound channel that stores delivered payloads. Refuses deliveries once closed.
class RecordingChannel final : public network::IOutboundChannel {
public:
	bool deliver(const network::core::Message& payload) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		++m_attempts;
		if (m_closed) {
			return false;
		}
		m_payloads.push_back(payload);
		return true;
	}

	void close() {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_closed = true;
	}

	std::size_t attempts() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_attempts;
	}

	std::vector<network::core::Message> payloads() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_payloads;
	}

	//! Decoded responses in delivery order. Undecodable payloads show up as empty entries.
	std::vector<std::optional<Response>> responses() const {
		std::vector<std::optional<Response>> result;
		for (const auto& payload: payloads()) {
			result.push_back(network::fromServerMessage(payload));
		}
		return result;
	}

private:
	mutable std::mutex m_mutex;
	std::vector<network::core::Message> m_payloads;
	std::size_t m_attempts{0};
	bool m_closed{false};
};

} // namespace gomoku::gtest
