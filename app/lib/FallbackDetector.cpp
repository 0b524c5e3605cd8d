#include "FallbackDetector.hpp"

#include <algorithm>

FallbackDetector::FallbackDetector(std::vector<std::string> patterns, std::vector<int> fallback_statuses)
    : fallback_statuses_(std::move(fallback_statuses))
{
    patterns_.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
}

std::vector<std::string> FallbackDetector::default_patterns()
{
    return {
        // English
        R"re(\b(please|kindly)\s+(send|attach|upload|share|provide)\s+(me\s+)?(an?|the|your)\s+(image|photo|picture|screenshot))re",
        R"re(\b(can\s*not|can't|can’t|unable\s+to|don't|don’t|do\s+not)\s+(see|view|access|open|process)\s+(any\s+|the\s+|an?\s+|your\s+)?(attached\s+|uploaded\s+)?(image|photo|picture))re",
        R"re(\bno\s+(image|photo|picture)\s+(was|has\s+been|is|were)\s+(attached|provided|uploaded|included|shared))re",
        R"re(\b(haven't|haven’t|have\s+not|didn't|didn’t|did\s+not)\s+(attach|provide|upload|include|send|share)(ed)?\s+(an?\s+|the\s+|any\s+)?(image|photo|picture))re",
        // Spanish
        R"re((env(i|í)a|adjunta|sube|comparte|manda)(me)?\s+(una|la|tu)\s+(imagen|foto))re",
        R"re(no\s+(puedo|logro|consigo)\s+(ver|acceder\s+a|abrir)\s+(la\s+|una\s+|ninguna\s+)?(imagen|foto))re",
        R"re(no\s+(se\s+ha\s+adjuntado|hay|veo)\s+(ninguna\s+)?(imagen|foto))re",
        // German
        R"re((sende|schicke|schick|lade)\w*\s+(mir\s+)?(bitte\s+)?(ein|das|dein)\s+(bild|foto))re",
        R"re((kann|konnte)\s+(ich\s+)?(kein|das|die|ein)\w*\s+(bild|foto)\w*\s+(nicht\s+)?(sehen|öffnen|erkennen|finden))re",
        R"re(kein\s+(bild|foto)\s+(wurde\s+)?(angehängt|hochgeladen|bereitgestellt|gesendet|gefunden))re",
        // French
        R"re((envoyez|envoie|joignez|joins|partagez|téléchargez|fournissez)(-moi)?\s+(une\s+|l'|l’|votre\s+)(image|photo))re",
        R"re(ne\s+(peux|parviens|vois)\s+pas\s+(à\s+)?(voir|accéder\s+à|ouvrir)?\s*(l'|l’|une\s+|d'|d’|aucune\s+|cette\s+)?(image|photo))re",
        R"re(aucune\s+(image|photo)\s+(n'a\s+été|n’a\s+été|n'est|n’est)\s+(jointe|fournie|envoyée|partagée))re",
        // Italian
        R"re((invia|allega|carica|condividi|manda)(mi)?\s+(un'|un’|una\s+|l'|l’|la\s+tua\s+)\s*(immagine|foto))re",
        R"re(non\s+(posso|riesco\s+a)\s+(vedere|accedere\s+a|aprire)\s+(l'|l’|un'|un’|alcuna\s+|nessuna\s+|la\s+|una\s+)?\s*(immagine|foto))re",
        R"re(nessuna\s+(immagine|foto)\s+(è\s+stata\s+)?(allegata|fornita|caricata|inviata))re",
        // Portuguese
        R"re((envie|anexe|carregue|compartilhe|mande)(-me)?\s+(uma|a|sua)\s+(imagem|foto))re",
        R"re(n(ã|a)o\s+(consigo|posso)\s+(ver|acessar|abrir|visualizar)\s+(a\s+|nenhuma\s+|uma\s+|essa\s+)?(imagem|foto))re",
        R"re(nenhuma\s+(imagem|foto)\s+(foi\s+)?(anexada|enviada|fornecida))re",
        // Russian
        R"re((пришлите|отправьте|прикрепите|загрузите|пришли|отправь|прикрепи)\s+(мне\s+)?(пожалуйста\s+)?(изображение|фото|картинку|снимок))re",
        R"re(не\s+(вижу|могу\s+(увидеть|видеть|открыть|просмотреть))\s+(никакого\s+|никакое\s+|это\s+|ваше\s+)?(изображени|фото|картин))re",
    };
}

std::vector<int> FallbackDetector::default_fallback_statuses()
{
    return {400, 404, 422};
}

bool FallbackDetector::looks_like_missing_image(const std::string& text) const
{
    if (text.empty()) {
        return false;
    }
    return std::any_of(patterns_.begin(), patterns_.end(), [&text](const std::regex& pattern) {
        return std::regex_search(text, pattern);
    });
}

bool FallbackDetector::is_fallback_status(int status) const
{
    return std::find(fallback_statuses_.begin(), fallback_statuses_.end(), status) != fallback_statuses_.end();
}

FallbackReason FallbackDetector::evaluate(const ChatAttemptOutcome& outcome) const
{
    if (outcome.reply) {
        return looks_like_missing_image(*outcome.reply) ? FallbackReason::MissingImageReply
                                                        : FallbackReason::None;
    }
    if (outcome.error_status && is_fallback_status(*outcome.error_status)) {
        return FallbackReason::RejectedStatus;
    }
    return FallbackReason::None;
}
