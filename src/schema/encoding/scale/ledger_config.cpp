#include <custodian/schema/encoding/scale/conversion_failure_policy.hpp>
#include <custodian/schema/encoding/scale/ledger_config.hpp>

using namespace custodian::schema;

namespace custodian::schema::encoding::scale {

void encode(ledger_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.custody_account, encoder);
  encode(o.administrator, encoder);
  encode(o.settlement_asset, encoder);
  encode(o.native_wrapper_asset, encoder);
  encode(o.exchange_adapter, encoder);
  encode(o.capacity_limit, encoder);
  encode(o.withdrawal_ceiling, encoder);
  encode(o.conversion_deadline_window, encoder);
  encode(o.failure_policy, encoder);
}

void decode(ledger_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.custody_account, decoder);
  decode(o.administrator, decoder);
  decode(o.settlement_asset, decoder);
  decode(o.native_wrapper_asset, decoder);
  decode(o.exchange_adapter, decoder);
  decode(o.capacity_limit, decoder);
  decode(o.withdrawal_ceiling, decoder);
  decode(o.conversion_deadline_window, decoder);
  decode(o.failure_policy, decoder);
}

}  // namespace custodian::schema::encoding::scale
