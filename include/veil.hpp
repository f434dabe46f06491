#ifndef VEIL_HPP
#define VEIL_HPP

#include "veil/core/common.hpp"
#include "veil/core/data_category.hpp"
#include "veil/core/sensitive_field.hpp"
#include "veil/core/engine_config.hpp"
#include "veil/core/configuration_error.hpp"
#include "veil/core/mask_utils.hpp"
#include "veil/formatter/formatter_interface.hpp"
#include "veil/formatter/builtin_formatters.hpp"
#include "veil/obfuscator/obfuscator_interface.hpp"
#include "veil/obfuscator/default_obfuscator.hpp"
#include "veil/obfuscator/partial_obfuscator.hpp"
#include "veil/registry/formatter_registry.hpp"
#include "veil/registry/obfuscator_registry.hpp"
#include "veil/engine/pattern_compiler.hpp"
#include "veil/engine/type_pattern_table.hpp"
#include "veil/engine/resolution.hpp"
#include "veil/engine/masking_engine.hpp"
#include "veil/config/env_config.hpp"
#include "veil/config/json_config.hpp"
#include "veil/masking_configuration.hpp"
#include "veil/log/log_level.hpp"
#include "veil/log/log_entry.hpp"
#include "veil/log/logger.hpp"
#include "veil/layout/layout_interface.hpp"
#include "veil/layout/human_readable_layout.hpp"
#include "veil/layout/json_layout.hpp"
#include "veil/layout/masking_layout.hpp"
#include "veil/transport/transport_interface.hpp"
#include "veil/transport/stdout_transport.hpp"
#include "veil/sink/sink_interface.hpp"
#include "veil/sink/console_sink.hpp"
#include "veil/sink/callback_sink.hpp"
#include "veil/sink/masking_sink.hpp"
#include "veil/util/sensitive_to_string.hpp"

#endif // VEIL_HPP
