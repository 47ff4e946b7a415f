// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/type_id.hpp>

#include <cstdint>
#include <vector>

struct alert_filter;
struct item;
struct movement;
struct movement_request;
struct shortage_prediction;
struct stock_alert;
enum class ec : uint8_t;
enum class movement_kind : uint8_t;
enum class stock_status : uint8_t;

CAF_BEGIN_TYPE_ID_BLOCK(stock_monitor, first_custom_type_id)

  CAF_ADD_TYPE_ID(stock_monitor, (ec))
  CAF_ADD_TYPE_ID(stock_monitor, (item))
  CAF_ADD_TYPE_ID(stock_monitor, (std::vector<item>))
  CAF_ADD_TYPE_ID(stock_monitor, (movement_kind))
  CAF_ADD_TYPE_ID(stock_monitor, (movement))
  CAF_ADD_TYPE_ID(stock_monitor, (std::vector<movement>))
  CAF_ADD_TYPE_ID(stock_monitor, (movement_request))
  CAF_ADD_TYPE_ID(stock_monitor, (stock_status))
  CAF_ADD_TYPE_ID(stock_monitor, (alert_filter))
  CAF_ADD_TYPE_ID(stock_monitor, (stock_alert))
  CAF_ADD_TYPE_ID(stock_monitor, (std::vector<stock_alert>))
  CAF_ADD_TYPE_ID(stock_monitor, (shortage_prediction))
  CAF_ADD_TYPE_ID(stock_monitor, (std::vector<shortage_prediction>))

  // Used to apply a movement to an item.
  CAF_ADD_ATOM(stock_monitor, apply_atom)

  // Used to retrieve the movement history of an item.
  CAF_ADD_ATOM(stock_monitor, history_atom)

  // Used to classify the current quantity of an item.
  CAF_ADD_ATOM(stock_monitor, status_atom)

  // Used to collect the current stock alerts.
  CAF_ADD_ATOM(stock_monitor, alerts_atom)

  // Used to predict the shortage date of a single item.
  CAF_ADD_ATOM(stock_monitor, predict_atom)

  // Used to predict the shortage dates of all items.
  CAF_ADD_ATOM(stock_monitor, predict_all_atom)

CAF_END_TYPE_ID_BLOCK(stock_monitor)
