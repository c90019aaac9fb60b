#ifndef _GGPKRES_INTERNAL_LISTENERMANAGER_H_
#define _GGPKRES_INTERNAL_LISTENERMANAGER_H_

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "CallOnDestruction.h"

namespace GgpkRes::Internal {

	/// Event callback management class.
	/// Only the owning class F may fire events; anyone may subscribe.
	template <typename F, typename ... T>
	class ListenerManager {
		friend F;

		struct State {
			std::mutex Mtx;
			size_t NextId = 0;
			std::map<size_t, std::function<void(T ...)>> Callbacks;
		};

		const std::shared_ptr<State> m_state = std::make_shared<State>();

	public:
		ListenerManager() = default;
		ListenerManager(const ListenerManager&) = delete;
		ListenerManager& operator=(const ListenerManager&) = delete;

		~ListenerManager() {
			std::lock_guard lock(m_state->Mtx);
			m_state->Callbacks.clear();
		}

		[[nodiscard]] bool Empty() const {
			std::lock_guard lock(m_state->Mtx);
			return m_state->Callbacks.empty();
		}

		/// \brief Adds a callback function to call when an event has been fired.
		/// \returns An object that will remove the callback when destructed.
		[[nodiscard]] CallOnDestruction operator() (std::function<void(T ...)> fn) {
			std::lock_guard lock(m_state->Mtx);
			const auto callbackId = m_state->NextId++;
			m_state->Callbacks.emplace(callbackId, std::move(fn));

			// Holds the state weakly so that a subscription may outlive the manager.
			return CallOnDestruction([weakState = std::weak_ptr<State>(m_state), callbackId]() {
				if (const auto state = weakState.lock()) {
					std::lock_guard lock(state->Mtx);
					state->Callbacks.erase(callbackId);
				}
			});
		}

	protected:
		/// \brief Fires an event.
		/// \returns Number of callbacks called.
		size_t operator() (T ... t) {
			std::vector<std::function<void(T ...)>> callbacks;
			{
				std::lock_guard lock(m_state->Mtx);
				for (const auto& cbp : m_state->Callbacks)
					callbacks.push_back(cbp.second);
			}

			for (const auto& cb : callbacks)
				cb(t...);
			return callbacks.size();
		}
	};
}

#endif
