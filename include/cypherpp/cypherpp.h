#pragma once
// ═══════════════════════════════════════════════════════════════════
//  cypherpp/cypherpp.h — Umbrella header for the cypherpp driver
// ═══════════════════════════════════════════════════════════════════
//
//  #include "cypherpp/cypherpp.h"
//  using namespace cypherpp;
//
//  This single include gives you:
//    • GraphClient, Query, TransactionBuilder
//    • Statement, ParamValue, CYPHER_SERIALIZE
//    • Transaction, LockedTransaction
//    • ResultTable, Row, QueryResponse
//    • GraphError and its subclasses
//    • console::setLevel()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "error.h"

// Values and statements
#include "value.h"
#include "coerce.h"
#include "statement.h"

// Wire
#include "codec.h"
#include "result.h"
#include "transport.h"
#include "url.h"

// Transactions and client
#include "transaction.h"
#include "client.h"
