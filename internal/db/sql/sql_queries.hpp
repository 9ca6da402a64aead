#pragma once

namespace keyshop::db::sql {

/*
  Canonical SQL used by all SQL backends.

  IMPORTANT:
  These are written in the subset shared by SQLite (>= 3.35, for RETURNING)
  and PostgreSQL, with $n placeholders.
*/

// pending ledger

static constexpr const char* UPSERT_PENDING_INTENT =
    "INSERT INTO pending_transactions(payment_id,owner_id,amount_minor,currency,metadata,status,created_at_ms,updated_at_ms)"
    " VALUES($1,$2,$3,$4,$5,'pending',$6,$6)"
    " ON CONFLICT(payment_id) DO UPDATE SET"
    " amount_minor=excluded.amount_minor,"
    " currency=excluded.currency,"
    " metadata=excluded.metadata,"
    " updated_at_ms=excluded.updated_at_ms"
    " WHERE pending_transactions.status='pending'";

#define KEYSHOP_PENDING_COLUMNS "payment_id,owner_id,amount_minor,currency,metadata,status,created_at_ms,updated_at_ms"

static constexpr const char* SELECT_PENDING =
    "SELECT " KEYSHOP_PENDING_COLUMNS " FROM pending_transactions WHERE payment_id=$1";

static constexpr const char* MARK_PAID =
    "UPDATE pending_transactions SET status='paid',updated_at_ms=$2"
    " WHERE payment_id=$1 AND status='pending'";

static constexpr const char* SELECT_LATEST_PENDING_FOR_OWNER =
    "SELECT " KEYSHOP_PENDING_COLUMNS " FROM pending_transactions"
    " WHERE owner_id=$1 AND status='pending'"
    " ORDER BY updated_at_ms DESC, created_at_ms DESC LIMIT 1";

static constexpr const char* SELECT_PAID_WITHOUT_CLAIM =
    "SELECT " KEYSHOP_PENDING_COLUMNS " FROM pending_transactions t"
    " WHERE t.status='paid' AND t.updated_at_ms<$1 AND NOT EXISTS"
    " (SELECT 1 FROM processed_payments p WHERE p.payment_id=t.payment_id)"
    " ORDER BY t.updated_at_ms";

// fulfillment guard

static constexpr const char* INSERT_PROCESSED_PAYMENT =
    "INSERT INTO processed_payments(payment_id,claimed_at_ms) VALUES($1,$2)"
    " ON CONFLICT(payment_id) DO NOTHING";

static constexpr const char* SELECT_CLAIMS_WITHOUT_RESULT =
    "SELECT p.payment_id,p.claimed_at_ms FROM processed_payments p"
    " WHERE p.claimed_at_ms<$1 AND NOT EXISTS"
    " (SELECT 1 FROM fulfillment_outcomes o WHERE o.payment_id=p.payment_id AND o.step='result')"
    " ORDER BY p.claimed_at_ms";

// credentials

#define KEYSHOP_CREDENTIAL_COLUMNS \
  "credential_id,owner_id,provider_host,remote_uuid,unique_identity,expires_at_ms,missing_since_ms,origin,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_CREDENTIAL =
    "INSERT INTO credentials(owner_id,provider_host,remote_uuid,unique_identity,expires_at_ms,missing_since_ms,origin,created_at_ms,updated_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)"
    " ON CONFLICT(unique_identity) DO NOTHING RETURNING credential_id";

static constexpr const char* SELECT_CREDENTIAL =
    "SELECT " KEYSHOP_CREDENTIAL_COLUMNS " FROM credentials WHERE credential_id=$1";

static constexpr const char* SELECT_CREDENTIAL_BY_IDENTITY =
    "SELECT " KEYSHOP_CREDENTIAL_COLUMNS " FROM credentials WHERE unique_identity=$1";

static constexpr const char* SELECT_CREDENTIALS_FOR_OWNER =
    "SELECT " KEYSHOP_CREDENTIAL_COLUMNS " FROM credentials WHERE owner_id=$1 ORDER BY credential_id";

static constexpr const char* SELECT_ALL_CREDENTIALS =
    "SELECT " KEYSHOP_CREDENTIAL_COLUMNS " FROM credentials ORDER BY credential_id";

static constexpr const char* UPDATE_CREDENTIAL =
    "UPDATE credentials SET owner_id=$2,provider_host=$3,remote_uuid=$4,unique_identity=$5,"
    "expires_at_ms=$6,origin=$7,updated_at_ms=$8 WHERE credential_id=$1";

static constexpr const char* SET_CREDENTIAL_MISSING_SINCE =
    "UPDATE credentials SET missing_since_ms=$2 WHERE credential_id=$1";

static constexpr const char* DELETE_CREDENTIAL =
    "DELETE FROM credentials WHERE credential_id=$1";

// accounts

static constexpr const char* SELECT_ACCOUNT =
    "SELECT owner_id,balance_minor,referrer_id,referral_balance_minor,referral_total_minor,created_at_ms"
    " FROM accounts WHERE owner_id=$1";

static constexpr const char* UPSERT_ACCOUNT =
    "INSERT INTO accounts(owner_id,balance_minor,referrer_id,referral_balance_minor,referral_total_minor,created_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6)"
    " ON CONFLICT(owner_id) DO UPDATE SET"
    " balance_minor=excluded.balance_minor,"
    " referrer_id=excluded.referrer_id,"
    " referral_balance_minor=excluded.referral_balance_minor,"
    " referral_total_minor=excluded.referral_total_minor";

static constexpr const char* ENSURE_ACCOUNT =
    "INSERT INTO accounts(owner_id,balance_minor,referral_balance_minor,referral_total_minor,created_at_ms)"
    " VALUES($1,0,0,0,$2) ON CONFLICT(owner_id) DO NOTHING";

static constexpr const char* ADJUST_BALANCE =
    "UPDATE accounts SET balance_minor=balance_minor+$2"
    " WHERE owner_id=$1 AND balance_minor+$2>=0";

static constexpr const char* ADJUST_REFERRAL_BALANCE =
    "UPDATE accounts SET referral_balance_minor=referral_balance_minor+$2,"
    "referral_total_minor=referral_total_minor+$2 WHERE owner_id=$1";

// payment log

static constexpr const char* INSERT_PAYMENT_LOG =
    "INSERT INTO payment_log(owner_id,payment_id,payment_method,amount_minor,currency,action,status,metadata,created_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING log_id";

static constexpr const char* SELECT_PAYMENT_LOG_FOR_OWNER =
    "SELECT log_id,owner_id,payment_id,payment_method,amount_minor,currency,action,status,metadata,created_at_ms"
    " FROM payment_log WHERE owner_id=$1 ORDER BY log_id";

// promo codes

static constexpr const char* SELECT_PROMO_CODE =
    "SELECT code,discount_minor,discount_percent,usage_limit_total,usage_limit_per_owner,used_total,valid_until_ms,is_active"
    " FROM promo_codes WHERE code=$1";

static constexpr const char* UPSERT_PROMO_CODE =
    "INSERT INTO promo_codes(code,discount_minor,discount_percent,usage_limit_total,usage_limit_per_owner,used_total,valid_until_ms,is_active)"
    " VALUES($1,$2,$3,$4,$5,$6,$7,$8)"
    " ON CONFLICT(code) DO UPDATE SET"
    " discount_minor=excluded.discount_minor,"
    " discount_percent=excluded.discount_percent,"
    " usage_limit_total=excluded.usage_limit_total,"
    " usage_limit_per_owner=excluded.usage_limit_per_owner,"
    " used_total=excluded.used_total,"
    " valid_until_ms=excluded.valid_until_ms,"
    " is_active=excluded.is_active";

static constexpr const char* INSERT_PROMO_USAGE =
    "INSERT INTO promo_usages(code,owner_id,applied_minor,order_id,used_at_ms)"
    " VALUES($1,$2,$3,$4,$5) ON CONFLICT(order_id) DO NOTHING RETURNING usage_id";

static constexpr const char* COUNT_PROMO_USAGES_BY_OWNER =
    "SELECT COUNT(*) FROM promo_usages WHERE code=$1 AND owner_id=$2";

static constexpr const char* INCREMENT_PROMO_USAGE =
    "UPDATE promo_codes SET used_total=used_total+1 WHERE code=$1";

static constexpr const char* SET_PROMO_ACTIVE =
    "UPDATE promo_codes SET is_active=$2 WHERE code=$1";

// partner commissions

static constexpr const char* INSERT_COMMISSION =
    "INSERT INTO partner_commissions(instance_id,payment_id,owner_id,amount_minor,percent,commission_minor,payment_method,created_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(instance_id,payment_id) DO NOTHING";

static constexpr const char* SELECT_COMMISSIONS =
    "SELECT instance_id,payment_id,owner_id,amount_minor,percent,commission_minor,payment_method,created_at_ms"
    " FROM partner_commissions WHERE instance_id=$1 ORDER BY created_at_ms,payment_id";

// pending gifts

static constexpr const char* INSERT_PENDING_GIFT =
    "INSERT INTO pending_gifts(payment_id,payer_id,metadata,created_at_ms) VALUES($1,$2,$3,$4)"
    " ON CONFLICT(payment_id) DO NOTHING";

static constexpr const char* SELECT_PENDING_GIFT =
    "SELECT payment_id,payer_id,metadata,created_at_ms FROM pending_gifts WHERE payment_id=$1";

static constexpr const char* DELETE_PENDING_GIFT =
    "DELETE FROM pending_gifts WHERE payment_id=$1";

// fulfillment outcomes

static constexpr const char* UPSERT_FULFILLMENT_OUTCOME =
    "INSERT INTO fulfillment_outcomes(payment_id,step,seq,status,detail,recorded_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6)"
    " ON CONFLICT(payment_id,seq) DO UPDATE SET"
    " step=excluded.step,"
    " status=excluded.status,"
    " detail=excluded.detail,"
    " recorded_at_ms=excluded.recorded_at_ms";

static constexpr const char* SELECT_FULFILLMENT_OUTCOMES =
    "SELECT payment_id,step,seq,status,detail,recorded_at_ms FROM fulfillment_outcomes"
    " WHERE payment_id=$1 ORDER BY seq";

#undef KEYSHOP_PENDING_COLUMNS
#undef KEYSHOP_CREDENTIAL_COLUMNS

}
