#pragma once

#include <chrono>
#include <condition_variable>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace usb_broker {
namespace core {

/// Begin() 的结果
enum class Admission {
  kExecute,   // 调用方执行并 Set() 结果
  kReplay,    // 已有结果, 直接回放
  kInFlight,  // 第一次请求仍在执行, 等待超时
};

/**
 * @brief 请求去重缓存: 同一 request_id 的重试拿到第一次的应答.
 *
 * 租约 RPC 不是天然幂等的 (Renew 每次都延长, Release 第二次会变成
 * INVALID_TOKEN). 客户端超时重试时第一次调用可能还没返回, 所以 Begin()
 * 先登记一个执行中的占位, 并发的重复请求在占位上等待结果, 而不是再执行一次.
 *
 * 键 = scope + request_id, scope 通常是 RPC 名.
 * 容量按 LRU 淘汰, 已完成的条目按 ttl 过期. Thread-safe.
 */
class IdempotencyCache {
public:
  explicit IdempotencyCache(int ttl_seconds = 600, size_t max_entries = 10000)
      : ttl_(std::chrono::seconds(ttl_seconds)),
        max_entries_(max_entries) {}

  /// 占位或取回结果. kInFlight 表示等待 wait 之后第一次请求仍未完成.
  Admission Begin(const std::string &scope, const std::string &request_id,
                  std::string *out_response,
                  std::chrono::milliseconds wait) {
    if (request_id.empty()) return Admission::kExecute;

    const std::string key = MakeKey(scope, request_id);
    const auto deadline = std::chrono::steady_clock::now() + wait;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      auto it = index_.find(key);
      if (it != index_.end() && !it->second->in_flight &&
          IsExpired(*it->second)) {
        order_.erase(it->second);
        index_.erase(it);
        it = index_.end();
      }
      if (it == index_.end()) {
        InsertLocked(key, std::string(), true);
        return Admission::kExecute;
      }
      if (!it->second->in_flight) {
        if (out_response) *out_response = it->second->response_data;
        return Admission::kReplay;
      }
      // 占位被撤销或完成时醒来重新检查
      if (done_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
        auto again = index_.find(key);
        if (again != index_.end() && again->second->in_flight) {
          return Admission::kInFlight;
        }
      }
    }
  }

  /// 只取已完成的结果, 不占位
  bool TryGet(const std::string &scope, const std::string &request_id,
              std::string *out_response) {
    if (request_id.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(MakeKey(scope, request_id));
    if (it == index_.end() || it->second->in_flight) return false;

    if (IsExpired(*(it->second))) {
      order_.erase(it->second);
      index_.erase(it);
      return false;
    }
    if (out_response) {
      *out_response = it->second->response_data;
    }
    return true;
  }

  /// 记录结果 (完成占位或直接写入), 唤醒等待的重复请求
  void Set(const std::string &scope, const std::string &request_id,
           std::string response_data) {
    if (request_id.empty()) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const std::string key = MakeKey(scope, request_id);
      auto it = index_.find(key);
      if (it != index_.end()) {
        it->second->response_data = std::move(response_data);
        it->second->in_flight = false;
        it->second->timestamp = std::chrono::steady_clock::now();
        order_.splice(order_.end(), order_, it->second);
      } else {
        InsertLocked(key, std::move(response_data), false);
      }
    }
    done_cv_.notify_all();
  }

  /// 撤销未完成的占位, 等待者之一将接手执行
  void Abandon(const std::string &scope, const std::string &request_id) {
    if (request_id.empty()) return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = index_.find(MakeKey(scope, request_id));
      if (it == index_.end() || !it->second->in_flight) return;
      order_.erase(it->second);
      index_.erase(it);
    }
    done_cv_.notify_all();
  }

  /// 清理过期条目: 从最旧端扫描, 遇到未过期或执行中即停
  void Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!order_.empty()) {
      auto &oldest = order_.front();
      if (oldest.in_flight || !IsExpired(oldest)) break;
      index_.erase(oldest.key);
      order_.pop_front();
    }
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
  }

private:
  struct Entry {
    std::string key;
    std::string response_data;
    std::chrono::steady_clock::time_point timestamp;
    bool in_flight{false};
  };

  static std::string MakeKey(const std::string &scope,
                             const std::string &request_id) {
    return scope + '\x1f' + request_id;
  }

  bool IsExpired(const Entry &entry) const {
    return (std::chrono::steady_clock::now() - entry.timestamp) >= ttl_;
  }

  void InsertLocked(const std::string &key, std::string response_data,
                    bool in_flight) {
    // 淘汰最旧的已完成条目; 执行中的占位不淘汰
    auto victim = order_.begin();
    while (index_.size() >= max_entries_ && victim != order_.end()) {
      if (victim->in_flight) {
        ++victim;
        continue;
      }
      index_.erase(victim->key);
      victim = order_.erase(victim);
    }
    order_.push_back(Entry{key, std::move(response_data),
                           std::chrono::steady_clock::now(), in_flight});
    index_[key] = std::prev(order_.end());
  }

  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  std::list<Entry> order_;  // 按插入/完成时间排序
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  std::chrono::seconds ttl_;
  size_t max_entries_;
};

/**
 * 一次 RPC 在缓存里的占位. 作用域结束时仍未 Complete (提前返回的错误路径)
 * 就撤销占位, 之后的重试会重新执行.
 */
class IdempotentCall {
public:
  IdempotentCall(IdempotencyCache &cache, std::string scope,
                 std::string request_id, std::chrono::milliseconds wait)
      : cache_(cache), scope_(std::move(scope)),
        request_id_(std::move(request_id)) {
    admission_ = cache_.Begin(scope_, request_id_, &cached_, wait);
  }

  ~IdempotentCall() {
    if (admission_ == Admission::kExecute && !completed_) {
      cache_.Abandon(scope_, request_id_);
    }
  }

  IdempotentCall(const IdempotentCall &) = delete;
  IdempotentCall &operator=(const IdempotentCall &) = delete;

  Admission admission() const { return admission_; }
  const std::string &cached_response() const { return cached_; }
  const std::string &request_id() const { return request_id_; }

  void Complete(std::string response) {
    completed_ = true;
    cache_.Set(scope_, request_id_, std::move(response));
  }

private:
  IdempotencyCache &cache_;
  std::string scope_;
  std::string request_id_;
  std::string cached_;
  Admission admission_{Admission::kExecute};
  bool completed_{false};
};

} // namespace core
} // namespace usb_broker
