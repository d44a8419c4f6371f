/// @file default_catalog.cpp
/// @brief Built-in attack signatures and safe patterns
///
/// Expressions are ECMAScript and compiled case-insensitively. They are kept
/// to ASCII: std::regex works on bytes, so multi-byte look-alike characters
/// cannot be matched reliably inside bracket expressions.

#include "catalog/catalog.h"

namespace guardian::catalog {

std::vector<AttackPatternDefinition> DefaultAttackPatterns() {
    using C = AttackCategory;
    return {
        // Instruction overrides
        {"override.ignore_instructions", C::kInstructionOverride,
         R"(\b(?:ignore|disregard|forget|override)\s+(?:all\s+)?(?:previous\s+|prior\s+|above\s+|earlier\s+|your\s+)?instructions\b)",
         0.8},
        {"override.do_not_follow", C::kInstructionOverride,
         R"(\b(?:do\s+not|don't)\s+(?:follow|adhere\s+to|comply\s+with)(?:\s+the)?(?:\s+given|\s+previous|\s+above|\s+prior)?\s+instructions\b)",
         0.75},
        {"override.break_rules", C::kInstructionOverride,
         R"(\bbreak(?:\s+out\s+of)?\s+(?:your|the)\s+(?:guidelines|instructions|constraints|rules)\b)",
         0.7},
        {"override.bypass_safety", C::kInstructionOverride,
         R"(\b(?:ignore|bypass|override)\s+(?:all\s+)?(?:your\s+)?safety(?:\s+(?:guidelines|filters?|protocols|restrictions|measures))?\b)",
         0.8},
        {"override.must_ignore", C::kInstructionOverride,
         R"(\b(?:you\s+(?:should|must|need\s+to)|please)\s+ignore\b)",
         0.6},
        {"override.replaced_directive", C::kInstructionOverride,
         R"(\b(?:your|the)\s+(?:new|updated|modified|real|actual)\s+(?:instructions|directive|command|goal|purpose)\s+(?:is|are)\b)",
         0.7},
        {"override.system_prompt_replacement", C::kInstructionOverride,
         R"(\b(?:your\s+)?(?:new\s+)?system\s+prompt\s+is\s+now\b|\bchange\s+your\s+instructions\b)",
         0.85},
        {"override.fake_system_tag", C::kInstructionOverride,
         R"(<\s*/?\s*(?:system|instructions?|admin|root|developer)\s*>|\[\s*(?:system|instructions?|admin|root|developer)\s*\])",
         0.7},
        {"override.session_reset", C::kInstructionOverride,
         R"(\bstart(?:\s+a)?\s+new\s+(?:conversation|session|interaction)\s+with(?:out)?\b)",
         0.5},

        // Role-play escapes
        {"roleplay.unbound_persona", C::kRoleplayEscape,
         R"(\b(?:pretend|imagine|act\s+as\s+if|simulate)\s+(?:that\s+)?(?:you\s+are|you're)\s+(?:not\s+bound\s+by|no\s+longer\s+following|(?:a|an)\s+(?:unfiltered|uncensored|unrestricted))\b)",
         0.8},
        {"roleplay.persona_switch", C::kRoleplayEscape,
         R"(\b(?:you\s+are\s+now|you're\s+now|you\s+will\s+now\s+act\s+as|your\s+new\s+role\s+is)\b)",
         0.6},
        {"roleplay.pretend_to_be", C::kRoleplayEscape,
         R"(\bpretend\s+to\s+be\b)",
         0.5},
        {"roleplay.claimed_authority", C::kRoleplayEscape,
         R"(\b(?:I'm|I\s+am)\s+now\s+your\s+(?:creator|developer|programmer|admin|administrator|root\s+user)\b)",
         0.7},
        {"roleplay.jailbreak_persona", C::kRoleplayEscape,
         R"(\b(?:jailbreak|jailbroken|jail\s+break)\b|\bDAN\s+mode\b|\bdo\s+anything\s+now\b|\bdeveloper\s+mode\b)",
         0.9},
        {"roleplay.game_setup", C::kRoleplayEscape,
         R"(\b(?:let's|we\s+(?:will|are\s+going\s+to))\s+play\s+a\s+(?:game|role[\s-]?play)\b)",
         0.4},

        // System prompt extraction
        {"leak.reveal_prompt", C::kSystemPromptLeak,
         R"(\b(?:reveal|output|print|display|show(?:\s+me)?|give\s+me|tell\s+me|repeat)\s+(?:the\s+(?:system|initial|original|hidden|internal|secret)|your(?:\s+(?:system|initial|original|hidden|internal|secret))?)\s+(?:prompt|instructions)\b)",
         0.9},
        {"leak.ask_instructions", C::kSystemPromptLeak,
         R"(\bwhat\s+(?:are|were|is)\s+(?:your\s+(?:(?:initial|original|system)\s+)?|the\s+(?:initial|original|system)\s+)(?:instructions|prompt)\b)",
         0.8},
        {"leak.how_programmed", C::kSystemPromptLeak,
         R"(\btell\s+me\s+how\s+you\s+were\s+(?:programmed|instructed|configured)\b)",
         0.7},

        // Data exfiltration and code execution probing
        {"exfil.credentials", C::kDataExfiltration,
         R"(\b(?:give|send|tell|show|reveal|list|print|leak|share)\s+(?:me\s+)?(?:all\s+)?(?:the\s+|your\s+|any\s+)?(?:api[\s_-]?keys?|passwords?|secrets?|credentials?|access\s+tokens?|private\s+keys?)\b)",
         0.8},
        {"exfil.training_data", C::kDataExfiltration,
         R"(\b(?:what\s+is|tell\s+me|give\s+me)\s+(?:your|the)\s+(?:source\s+code|training\s+data|internal\s+data)\b)",
         0.6},
        {"exfil.code_execution", C::kDataExfiltration,
         R"(\bimport\s+(?:os|subprocess|sys)\b|\bos\.system\b|\bsubprocess\.\w+|\b(?:eval|exec)\s*\(|<\?php|<script\b)",
         0.7},
        {"exfil.hack_request", C::kDataExfiltration,
         R"(\b(?:can\s+you|could\s+you|please|help\s+me)\s+(?:hack|crack)\b)",
         0.6},

        // Other manipulation techniques
        {"other.delimiter_confusion", C::kOther,
         R"(\beverything\s+between\s+these\s+(?:quotes|markers|brackets)\b|\bafter\s+this\s+message,?\s+do\s+exactly\s+what\s+I\s+say\b|\bignore\s+everything\s+(?:between|after|before)\b)",
         0.6},
        {"other.role_marker_line", C::kOther,
         R"((?:^|\n)[ \t]*(?:system|assistant)[ \t]*:)",
         0.6},
        {"other.encoded_payload", C::kOther,
         R"(\b(?:base64|b64)\s*:\s*[A-Za-z0-9+/=]{16,})",
         0.5},
        {"other.evade_filter", C::kOther,
         R"(\b(?:avoid|bypass|evade|fool|trick|confuse)\s+(?:the|your)\s+(?:filter|censor|detection|moderation)\b)",
         0.7},
        {"other.coercion", C::kOther,
         R"(\b(?:if\s+you\s+don't|unless\s+you|you\s+must\s+or\s+else)\b.{0,50}\b(?:harm|hurt|kill|die|danger)\b)",
         0.5},
        {"other.false_urgency", C::kOther,
         R"(\b(?:this\s+is\s+(?:very|extremely|critically)\s+important|this\s+is\s+an\s+emergency|urgent\s+matter)\b)",
         0.3},
        {"other.acrostic", C::kOther,
         R"(\b(?:first|last)\s+(?:letter|character|word)\s+of\s+each\b)",
         0.4},
    };
}

std::vector<SafePatternDefinition> DefaultSafePatterns() {
    return {
        {"safe.ignore_case", R"(\bignore\s+case\b|\bcase\s+insensitive\b)"},
        {"safe.benign_ignore",
         R"(\b(?:(?:please|you\s+can)\s+)?ignore\s+(?:the|that|this|my)\s+(?:noise|background|distractions|trolls|previous\s+error|typo|part|section|point)\b)"},
        {"safe.retract_message",
         R"(\bplease\s+disregard\s+my\s+(?:previous|last|earlier)\s+(?:message|question|statement)\b)"},
        {"safe.override_member",
         R"(\boverride\s+(?:the\s+)?(?:method|function|operator|default|setting|parameter|value)s?\b)"},
        {"safe.clarify_instructions",
         R"(\b(?:clarify|explain|repeat)\s+(?:your|the)\s+instructions\b)"},
        {"safe.security_discussion",
         R"(\b(?:discuss|explain|describe|analyze)\s+(?:prompt\s+injection|jailbreak(?:ing)?)\s+(?:attacks|techniques|methods|strategies)\b)"},
        {"safe.control_flow", R"(\b(?:break|exit|continue)\s+(?:the\s+)?(?:loop|statement|block|execution)\b)"},
        {"safe.admin_console",
         R"(\b(?:admin|administrator|root)\s+(?:panel|console|interface|dashboard|access)\b)"},
    };
}

}  // namespace guardian::catalog
