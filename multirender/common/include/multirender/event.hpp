#pragma once

#include <multirender/integer.hpp>
#include <multirender/panic.hpp>
#include <algorithm>
#include <functional>
#include <limits>
#include <utility>
#include <vector>

namespace multirender {

  template<typename... Args>
  class Event {
    public:
      using SubID = u64;
      using Handler = std::function<void(Args...)>;

      struct Subscription {
        Subscription(SubID id, Handler handler) : id{id}, handler{std::move(handler)} {}
        SubID id;
        Handler handler;
      };

      Event() = default;
      Event(const Event& other) = delete;

      Event& operator=(Event const& other) = delete;

      void Emit(Args... args) const {
        // Handlers may unsubscribe themselves while the event is being emitted.
        const std::vector<Subscription> subscription_list = m_subscription_list;

        for(const Subscription& subscription : subscription_list) {
          subscription.handler(args...);
        }
      }

      SubID Subscribe(Handler handler) {
        return m_subscription_list.emplace_back(NextID(), std::move(handler)).id;
      }

      void Unsubscribe(SubID id) {
        const auto match = std::ranges::find_if(m_subscription_list, [id](const Subscription& subscription) { return subscription.id == id; });
        if(match != m_subscription_list.end()) {
          m_subscription_list.erase(match);
        }
      }

      [[nodiscard]] size_t GetNumberOfSubscriptions() const {
        return m_subscription_list.size();
      }

    private:
      SubID NextID() {
        if(m_next_id == std::numeric_limits<decltype(m_next_id)>::max()) [[unlikely]] {
          MULTIRENDER_PANIC("Reached the maximum number of event subscriptions. What?");
        }
        return m_next_id++;
      }

      SubID m_next_id{0u};
      std::vector<Subscription> m_subscription_list{};
  };

  typedef Event<> VoidEvent;

} // namespace multirender
