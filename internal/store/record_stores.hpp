#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "durable/v1/record.pb.h"
#include "internal/store/append_only_store.hpp"

namespace durable::store {

using RecordStore = AppendOnlyStore<durable::v1::Record>;

/*
  Named append-only stores of durable.v1.Record over one repository.

  Stores are created on first use and live as long as this registry.
*/
class RecordStores {
 public:
  explicit RecordStores(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  }

  std::shared_ptr<RecordStore> Get(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto&           store = stores_[name];
    if (!store) store = std::make_shared<RecordStore>(name, repository_);
    return store;
  }

  void CloseSubscriptions() {
    std::vector<std::shared_ptr<RecordStore>> stores;
    {
      std::lock_guard lock(mutex_);
      for (auto& [_, store] : stores_) stores.push_back(store);
    }
    for (auto& store : stores) store->CloseSubscriptions();
  }

 private:
  std::shared_ptr<db::Repository> repository_;

  std::mutex                                                    mutex_;
  std::unordered_map<std::string, std::shared_ptr<RecordStore>> stores_;
};

} // namespace durable::store
