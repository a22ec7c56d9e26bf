#include <custodian/schema/encoding/scale/ledger_totals.hpp>

using namespace custodian::schema;

namespace custodian::schema::encoding::scale {

void encode(ledger_totals<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.aggregate_value, encoder);
  encode(o.deposit_count, encoder);
  encode(o.withdrawal_count, encoder);
}

void decode(ledger_totals<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.aggregate_value, decoder);
  decode(o.deposit_count, decoder);
  decode(o.withdrawal_count, decoder);
}

}  // namespace custodian::schema::encoding::scale
