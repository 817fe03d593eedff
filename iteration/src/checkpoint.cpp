// hdrticks
//
// Copyright (c) 2026 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "checkpoint.h"

#include "kvstream.h"

namespace hdrticks::iteration {

std::ostream& operator<<(std::ostream& os, const CheckpointRecord& r) {
  os << KVLOG(r.percentile_level_iterated_to,
              r.percentile_level_iterated_from,
              r.value_iterated_to,
              r.value_iterated_from,
              r.count_at_value_iterated_to,
              r.count_added_in_this_iteration_step,
              r.total_count_to_this_value,
              r.percentile)
     << "," << KVLOG(r.total_value_to_this_value, r.total_count);
  return os;
}

}  // namespace hdrticks::iteration
