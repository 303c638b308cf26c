////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2024 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include <benchmark/benchmark.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/str_cat.h>

#include "graph/member_table.hpp"
#include "mask/context.hpp"
#include "mask/masker.hpp"

namespace {

struct PublicApi final : fieldmask::calling_context_base<PublicApi> {
  static constexpr std::string_view type_name() noexcept {
    return "PublicApi";
  }
};

struct Address {
  static constexpr std::string_view type_name() noexcept { return "Address"; }

  static void describe(fieldmask::member_table_builder<Address>& members) {
    members.field("Street", &Address::Street)
      .mask(fieldmask::mask_for_endpoint<PublicApi>());
    members.field("City", &Address::City);
  }

  std::string Street;
  std::string City;
};

struct Customer {
  static constexpr std::string_view type_name() noexcept {
    return "Customer";
  }

  static void describe(fieldmask::member_table_builder<Customer>& members) {
    members.field("Name", &Customer::Name);
    members.field("Email", &Customer::Email)
      .mask(fieldmask::mask_for_policy({"public"}));
    members.field("Addresses", &Customer::Addresses);
    members.field("Referrer", &Customer::Referrer);
  }

  std::string Name;
  std::optional<std::string> Email;
  std::vector<Address> Addresses;
  std::shared_ptr<Customer> Referrer;
};

std::vector<Customer> MakeCustomers(size_t count) {
  auto referrer = std::make_shared<Customer>();
  referrer->Name = "referrer";
  referrer->Email = "referrer@example.com";

  std::vector<Customer> customers(count);
  for (size_t i = 0; i < count; ++i) {
    auto& customer = customers[i];
    customer.Name = absl::StrCat("customer-", i);
    customer.Email = absl::StrCat("customer-", i, "@example.com");
    customer.Addresses.resize(3, Address{"Main St. 1", "Cologne"});
    customer.Referrer = referrer;
  }
  return customers;
}

void BM_Clone(benchmark::State& state) {
  const auto customers = MakeCustomers(state.range(0));
  for (auto _ : state) {
    auto copy = fieldmask::clone(customers);
    benchmark::DoNotOptimize(copy);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Clone)->Arg(1)->Arg(100)->Arg(10000);

void BM_MaskNoMatch(benchmark::State& state) {
  const auto customers = MakeCustomers(state.range(0));
  const fieldmask::masker masker{};
  for (auto _ : state) {
    auto masked = masker.mask(customers, "internal");
    benchmark::DoNotOptimize(masked);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_MaskNoMatch)->Arg(1)->Arg(100)->Arg(10000);

void BM_MaskWithContext(benchmark::State& state) {
  const auto customers = MakeCustomers(state.range(0));
  const fieldmask::masker masker{};
  const PublicApi ctx{};
  for (auto _ : state) {
    auto masked = masker.mask(customers, ctx, "public");
    benchmark::DoNotOptimize(masked);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_MaskWithContext)->Arg(1)->Arg(100)->Arg(10000);

void BM_MaskWithRegistry(benchmark::State& state) {
  const auto customers = MakeCustomers(state.range(0));
  fieldmask::rule_registry registry;
  registry.add<Customer>("Name", fieldmask::mask_for_policy({"public"}));
  registry.add<Address>("City", fieldmask::mask_when({.via = {"Customer"}}));
  const fieldmask::masker masker{{.registry = &registry}};
  for (auto _ : state) {
    auto masked = masker.mask(customers, "public");
    benchmark::DoNotOptimize(masked);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_MaskWithRegistry)->Arg(1)->Arg(100)->Arg(10000);

}  // namespace
