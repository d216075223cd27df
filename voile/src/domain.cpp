// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "voile/domain.hpp"

namespace voile {

DomainSeparator::DomainSeparator(std::string_view label)
    : label_{label}, digest_{LabeledHash{"voile.domain"}.add(label_).finish()} {}

}  // namespace voile
