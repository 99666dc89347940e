#include "token.h"
#include "rule.h"

#include <sstream>

std::string Token::debugform() const {
	std::ostringstream s;
	s << "Token[" << span.begin << ".." << span.end << ", " << payload->debugform();
	if (rule) {
		s << ", \"" << rule->name << "\" pass " << pass;
	}
	if (latent) {
		s << ", latent";
	}
	s << "]";
	return s.str();
}
