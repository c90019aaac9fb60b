#ifndef _GGPKRES_INTERNAL_CALLONDESTRUCTION_H_
#define _GGPKRES_INTERNAL_CALLONDESTRUCTION_H_

#include <functional>
#include <vector>

namespace GgpkRes::Internal {
	/// \brief Calls a function on destruction.
	/// Used to unbind listeners and to release backend handles on every exit path.
	class CallOnDestruction {
		std::function<void()> m_fn;

	public:
		CallOnDestruction() noexcept = default;
		CallOnDestruction(const CallOnDestruction&) = delete;
		CallOnDestruction& operator=(const CallOnDestruction&) = delete;

		CallOnDestruction(std::function<void()> fn)
			: m_fn(std::move(fn)) {
		}

		CallOnDestruction(CallOnDestruction&& r) noexcept
			: m_fn(std::move(r.m_fn)) {
			r.m_fn = nullptr;
		}

		CallOnDestruction& operator=(CallOnDestruction&& r) noexcept {
			Clear();
			m_fn = std::move(r.m_fn);
			r.m_fn = nullptr;
			return *this;
		}

		~CallOnDestruction() {
			if (m_fn)
				m_fn();
		}

		CallOnDestruction& Clear() {
			if (m_fn) {
				m_fn();
				m_fn = nullptr;
			}
			return *this;
		}

		void Cancel() {
			m_fn = nullptr;
		}

		explicit operator bool() const {
			return !!m_fn;
		}

		class Multiple {
			std::vector<CallOnDestruction> m_list;

		public:
			Multiple() = default;
			Multiple(const Multiple&) = delete;
			Multiple(Multiple&&) noexcept = default;
			Multiple& operator=(const Multiple&) = delete;

			Multiple& operator=(Multiple&& r) noexcept {
				Clear();
				m_list = std::move(r.m_list);
				return *this;
			}

			~Multiple() {
				Clear();
			}

			Multiple& operator+=(CallOnDestruction o) {
				if (o)
					m_list.emplace_back(std::move(o));
				return *this;
			}

			void Clear() {
				while (!m_list.empty()) {
					m_list.back().Clear();
					m_list.pop_back();
				}
			}
		};
	};
}

#endif
