#include "value.h"
#include "core/payloads/numeral.h"
#include "core/payloads/measure.h"
#include "core/payloads/text.h"

#include <cmath>
#include <iomanip>
#include <sstream>

std::string json_quote(const std::string &s) {
	std::ostringstream out;
	out << '"';
	for (const char c : s) {
		switch (c) {
			case '"':
				out << "\\\"";
				break;
			case '\\':
				out << "\\\\";
				break;
			case '\n':
				out << "\\n";
				break;
			case '\t':
				out << "\\t";
				break;
			default:
				if ((unsigned char)c < 0x20) {
					out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << int(c);
					out << std::dec << std::setfill(' ');
				} else {
					out << c;
				}
				break;
		}
	}
	out << '"';
	return out.str();
}

std::string json_number(double value) {
	std::ostringstream s;
	if (std::floor(value) == value && std::fabs(value) < 1e15) {
		s << int64_t(value);
	} else {
		s << std::setprecision(15) << value;
	}
	return s.str();
}

std::string NumberValue::format() const {
	return "{\"type\": \"value\", \"value\": " + json_number(value) + "}";
}

std::string OrdinalValue::format() const {
	return "{\"type\": \"value\", \"value\": " + std::to_string(value) + "}";
}

std::string MeasureValue::format() const {
	std::ostringstream s;
	s << "{\"type\": \"value\", \"value\": " << json_number(value);
	s << ", \"unit\": " << json_quote(unit);
	if (product) {
		s << ", \"product\": " << json_quote(*product);
	}
	s << "}";
	return s.str();
}

std::string TextValue::format() const {
	return "{\"type\": \"value\", \"value\": " + json_quote(value) + "}";
}

std::string GrainValue::format() const {
	return std::string("{\"type\": \"value\", \"value\": \"") + grain_name(grain) + "\"}";
}

std::string DurationValue::format() const {
	std::ostringstream s;
	s << "{\"type\": \"value\", \"value\": " << json_number(value);
	s << ", \"unit\": \"" << grain_name(grain) << "\"";
	s << ", \"normalized\": {\"value\": " << json_number(seconds) << ", \"unit\": \"second\"}}";
	return s.str();
}

std::string TimeValue::format() const {
	std::ostringstream s;
	s << "{\"type\": \"" << (interval ? "interval" : "value") << "\", \"values\": [";
	for (size_t i = 0; i < candidates.size(); i++) {
		const TimeInterval &candidate = candidates[i];
		if (i > 0) {
			s << ", ";
		}
		s << "{\"from\": " << json_quote(candidate.start_text);
		s << ", \"to\": " << json_quote(candidate.end_text);
		s << ", \"grain\": \"" << grain_name(candidate.grain) << "\"}";
	}
	s << "]}";
	return s.str();
}

void ValueConverters::add(Dimension dimension, const ValueConverter &converter) {
	m_converters[dimension] = converter;
}

bool ValueConverters::contains(Dimension dimension) const {
	return m_converters.find(dimension) != m_converters.end();
}

ResolvedValueRef ValueConverters::convert(
	const Token &token,
	const ResolutionContext &context,
	const EngineOptions &options) const {

	const auto i = m_converters.find(token.dimension());
	if (i == m_converters.end()) {
		return ResolvedValueRef();
	}
	return i->second(*token.payload, context, options);
}

namespace {

ResolvedValueRef convert_numeral(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const NumeralData *numeral = payload.as<NumeralData>();
	if (!numeral) {
		return ResolvedValueRef();
	}
	return std::make_shared<const NumberValue>(numeral->to_double());
}

ResolvedValueRef convert_ordinal(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const OrdinalData *ordinal = payload.as<OrdinalData>();
	if (!ordinal) {
		return ResolvedValueRef();
	}
	return std::make_shared<const OrdinalValue>(ordinal->value);
}

ResolvedValueRef convert_measure(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const MeasureData *measure = payload.as<MeasureData>();
	if (!measure || !measure->value || measure->unit.empty()) {
		// a bare unit or a number still waiting for its unit.
		return ResolvedValueRef();
	}
	return std::make_shared<const MeasureValue>(
		measure->dimension(), measure->value->get_d(), measure->unit, measure->product);
}

ResolvedValueRef convert_text(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const TextData *text = payload.as<TextData>();
	if (!text) {
		return ResolvedValueRef();
	}
	return std::make_shared<const TextValue>(text->dimension(), text->value);
}

ResolvedValueRef convert_grain(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const GrainData *grain = payload.as<GrainData>();
	if (!grain) {
		return ResolvedValueRef();
	}
	return std::make_shared<const GrainValue>(grain->grain);
}

ResolvedValueRef convert_duration(const Payload &payload, const ResolutionContext&, const EngineOptions&) {
	const DurationData *duration = payload.as<DurationData>();
	if (!duration) {
		return ResolvedValueRef();
	}
	const mpq_class seconds = duration->value * grain_seconds(duration->grain);
	return std::make_shared<const DurationValue>(
		duration->value.get_d(), duration->grain, seconds.get_d());
}

ResolvedValueRef convert_time(
	const Payload &payload,
	const ResolutionContext &context,
	const EngineOptions &options) {

	const TimeData *time = payload.as<TimeData>();
	if (!time) {
		return ResolvedValueRef();
	}

	std::vector<TimeInterval> candidates = resolve_time(
		*time, context.reference, context.timezone, options.max_time_candidates);
	if (candidates.empty()) {
		return ResolvedValueRef();
	}

	return std::make_shared<const TimeValue>(std::move(candidates), bool(time->interval_end));
}

} // namespace

ValueConverters ValueConverters::defaults() {
	ValueConverters converters;

	converters.add(Dimension::Numeral, convert_numeral);
	converters.add(Dimension::Ordinal, convert_ordinal);
	converters.add(Dimension::Time, convert_time);
	converters.add(Dimension::TimeGrain, convert_grain);
	converters.add(Dimension::Duration, convert_duration);

	for (Dimension d : {
		Dimension::Distance,
		Dimension::Temperature,
		Dimension::Volume,
		Dimension::Quantity,
		Dimension::Finance}) {

		converters.add(d, convert_measure);
	}

	for (Dimension d : {Dimension::PhoneNumber, Dimension::Email, Dimension::Url}) {
		converters.add(d, convert_text);
	}

	return converters;
}
