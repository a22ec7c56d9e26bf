#pragma once
#include <custodian/schema/ledger_config.hpp>
#include <scale/scale.hpp>

namespace custodian::schema::encoding::scale {

void encode(custodian::schema::ledger_config<1>&& o, ::scale::Encoder& encoder);
void decode(custodian::schema::ledger_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace custodian::schema::encoding::scale
