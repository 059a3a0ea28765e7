//
// Created by Giuseppe Francione on 08/10/26.
//

#include "../../include/trigram_classifier.hpp"
#include "../../include/text_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <map>
#include <unordered_map>

namespace subsmith {

namespace {

struct ReferenceText {
    const char* code;
    const char* text;
};

// One paragraph of everyday prose per language. Profiles are the ranked
// trigrams of these texts, so they share the tokenisation of the input.
constexpr ReferenceText kReferenceTexts[] = {
    {"eng",
        "The weather was warm and bright when we left the house in the morning, and the children "
        "ran ahead of us along the road to the river. There is something about the first days of "
        "summer that makes everyone want to be outside. We talked about the trip we had planned "
        "for the holidays and about the friends we would meet in the city. My father said that "
        "the old bridge had been closed for repairs, so we would have to take the other way "
        "through the forest. In the afternoon we stopped for lunch near a small village where the"
        " people were very friendly and the food was better than anything we had eaten in weeks. "
        "After that we walked for another hour, looking at the birds and the flowers, until the "
        "light began to fade and it was time to go home. This is a story about how we learned to "
        "enjoy the simple things in life, and how a short walk with the family can be the best "
        "part of the whole year. Thank you for watching this video, and please tell us what you "
        "think in the comments below. Today we are going to show you how to cook a great dinner "
        "with only three things from your kitchen. The interview with the president of the "
        "company will be published next week, together with the report on the new products."},
    {"fra",
        "Le temps était doux et lumineux quand nous sommes partis de la maison le matin, et les "
        "enfants couraient devant nous sur la route qui mène à la rivière. Il y a quelque chose "
        "dans les premiers jours de l'été qui donne envie à tout le monde de rester dehors. Nous "
        "avons parlé du voyage que nous avions prévu pour les vacances et des amis que nous "
        "allions retrouver en ville. Mon père a dit que le vieux pont était fermé pour des "
        "travaux, alors nous devions prendre l'autre chemin à travers la forêt. L'après-midi, "
        "nous nous sommes arrêtés pour déjeuner près d'un petit village où les gens étaient très "
        "gentils et où la cuisine était meilleure que tout ce que nous avions mangé depuis des "
        "semaines. Ensuite nous avons marché encore une heure, en regardant les oiseaux et les "
        "fleurs, jusqu'à ce que la lumière commence à baisser. C'est une histoire sur la façon "
        "dont nous avons appris à aimer les choses simples de la vie. Merci d'avoir regardé cette"
        " vidéo, et dites-nous ce que vous en pensez dans les commentaires. Aujourd'hui nous "
        "allons vous montrer comment préparer un excellent dîner avec seulement trois ingrédients"
        " de votre cuisine. L'entretien avec le président de l'entreprise sera publié la semaine "
        "prochaine, avec le rapport sur les nouveaux produits."},
    {"spa",
        "El tiempo era cálido y luminoso cuando salimos de casa por la mañana, y los niños "
        "corrían delante de nosotros por el camino que lleva al río. Hay algo en los primeros "
        "días del verano que hace que todo el mundo quiera estar fuera. Hablamos del viaje que "
        "habíamos planeado para las vacaciones y de los amigos que íbamos a encontrar en la "
        "ciudad. Mi padre dijo que el puente viejo estaba cerrado por obras, así que teníamos que"
        " tomar el otro camino a través del bosque. Por la tarde nos paramos a comer cerca de un "
        "pueblo pequeño donde la gente era muy amable y la comida era mejor que todo lo que "
        "habíamos comido en semanas. Después caminamos otra hora más, mirando los pájaros y las "
        "flores, hasta que la luz empezó a desaparecer y era hora de volver. Esta es una historia"
        " sobre cómo aprendimos a disfrutar de las cosas sencillas de la vida, y de cómo un paseo"
        " corto con la familia puede ser la mejor parte del año. Gracias por ver este vídeo, y "
        "dinos lo que piensas en los comentarios. Hoy vamos a enseñaros cómo preparar una cena "
        "estupenda con solo tres ingredientes de vuestra cocina. La entrevista con el presidente "
        "de la empresa se publicará la próxima semana, junto con el informe sobre los nuevos "
        "productos."},
    {"deu",
        "Das Wetter war warm und hell, als wir am Morgen das Haus verließen, und die Kinder "
        "liefen auf dem Weg zum Fluss vor uns her. Es gibt etwas an den ersten Tagen des Sommers,"
        " das jeden nach draußen zieht. Wir sprachen über die Reise, die wir für die Ferien "
        "geplant hatten, und über die Freunde, die wir in der Stadt treffen wollten. Mein Vater "
        "sagte, dass die alte Brücke wegen Bauarbeiten gesperrt sei, also mussten wir den anderen"
        " Weg durch den Wald nehmen. Am Nachmittag machten wir in der Nähe eines kleinen Dorfes "
        "eine Pause zum Mittagessen, wo die Leute sehr freundlich waren und das Essen besser war "
        "als alles, was wir seit Wochen gegessen hatten. Danach gingen wir noch eine Stunde "
        "weiter und schauten uns die Vögel und die Blumen an, bis das Licht schwächer wurde und "
        "es Zeit war, nach Hause zu gehen. Dies ist eine Geschichte darüber, wie wir gelernt "
        "haben, die einfachen Dinge im Leben zu genießen. Vielen Dank, dass ihr dieses Video "
        "angesehen habt, und schreibt uns eure Meinung in die Kommentare. Heute zeigen wir euch, "
        "wie man mit nur drei Zutaten aus der Küche ein gutes Abendessen kocht. Das Gespräch mit "
        "dem Vorstand des Unternehmens wird nächste Woche zusammen mit dem Bericht über die neuen"
        " Produkte veröffentlicht."},
    {"ita",
        "Il tempo era caldo e luminoso quando siamo usciti di casa la mattina, e i bambini "
        "correvano davanti a noi lungo la strada che porta al fiume. C'è qualcosa nei primi "
        "giorni dell'estate che fa venire voglia a tutti di stare fuori. Abbiamo parlato del "
        "viaggio che avevamo organizzato per le vacanze e degli amici che avremmo incontrato in "
        "città. Mio padre ha detto che il vecchio ponte era chiuso per lavori, quindi dovevamo "
        "prendere l'altra strada attraverso il bosco. Nel pomeriggio ci siamo fermati a pranzo "
        "vicino a un piccolo paese dove la gente era molto gentile e il cibo era migliore di "
        "tutto quello che avevamo mangiato nelle ultime settimane. Poi abbiamo camminato per "
        "un'altra ora, guardando gli uccelli e i fiori, finché la luce ha cominciato a calare ed "
        "era ora di tornare a casa. Questa è una storia su come abbiamo imparato ad apprezzare le"
        " cose semplici della vita, e su come una breve passeggiata con la famiglia possa essere "
        "la parte più bella dell'anno. Grazie per aver guardato questo video, e diteci cosa ne "
        "pensate nei commenti. Oggi vi mostriamo come preparare una cena ottima con solo tre "
        "ingredienti della vostra cucina. L'intervista con il presidente della società sarà "
        "pubblicata la prossima settimana, insieme alla relazione sui nuovi prodotti."},
    {"por",
        "O tempo estava quente e claro quando saímos de casa de manhã, e as crianças corriam à "
        "nossa frente pela estrada que leva ao rio. Há alguma coisa nos primeiros dias do verão "
        "que faz com que todos queiram ficar ao ar livre. Falamos da viagem que tínhamos "
        "planejado para as férias e dos amigos que iríamos encontrar na cidade. O meu pai disse "
        "que a ponte velha estava fechada para obras, então tivemos de tomar o outro caminho pela"
        " floresta. À tarde paramos para almoçar perto de uma pequena aldeia onde as pessoas eram"
        " muito simpáticas e a comida era melhor do que tudo o que tínhamos comido em semanas. "
        "Depois andamos mais uma hora, olhando os pássaros e as flores, até que a luz começou a "
        "desaparecer e estava na hora de voltar para casa. Esta é uma história sobre como "
        "aprendemos a aproveitar as coisas simples da vida, e como um passeio curto com a família"
        " pode ser a melhor parte do ano inteiro. Obrigado por assistir a este vídeo, e digam o "
        "que acham nos comentários. Hoje vamos mostrar como preparar um jantar ótimo com apenas "
        "três ingredientes da sua cozinha. A entrevista com o presidente da empresa será "
        "publicada na próxima semana, junto com o relatório sobre os novos produtos. Não perca a "
        "próxima edição e a nossa conversa com os convidados. No ano passado fomos pela primeira "
        "vez à praia e o nosso hotel ficava muito perto do mar, por isso todas as manhãs depois "
        "do pequeno almoço íamos nadar. À noite passeávamos pelas ruas antigas da cidade e "
        "comprávamos presentes nas pequenas lojas. Neste episódio vamos contar os lugares que "
        "visitamos, as comidas que provamos e as pessoas que conhecemos. Não se esqueçam de se "
        "inscrever no canal e de deixar o seu gosto no vídeo, até ao próximo vídeo."},
    {"nld",
        "Het weer was warm en helder toen we 's ochtends het huis verlieten, en de kinderen "
        "renden voor ons uit over de weg naar de rivier. Er is iets aan de eerste dagen van de "
        "zomer waardoor iedereen buiten wil zijn. We praatten over de reis die we voor de "
        "vakantie hadden gepland en over de vrienden die we in de stad zouden ontmoeten. Mijn "
        "vader zei dat de oude brug gesloten was voor werkzaamheden, dus moesten we de andere weg"
        " door het bos nemen. In de middag stopten we voor de lunch bij een klein dorp waar de "
        "mensen heel vriendelijk waren en het eten beter was dan alles wat we in weken hadden "
        "gegeten. Daarna liepen we nog een uur verder, kijkend naar de vogels en de bloemen, "
        "totdat het licht begon te verdwijnen en het tijd was om naar huis te gaan. Dit is een "
        "verhaal over hoe we hebben geleerd om van de eenvoudige dingen in het leven te genieten,"
        " en hoe een korte wandeling met de familie het mooiste deel van het jaar kan zijn. "
        "Bedankt voor het kijken naar deze video, en laat ons weten wat je ervan vindt in de "
        "reacties. Vandaag laten we zien hoe je een heerlijk diner maakt met maar drie "
        "ingrediënten uit je keuken. Het gesprek met de directeur van het bedrijf wordt volgende "
        "week gepubliceerd, samen met het verslag over de nieuwe producten."},
    {"tur",
        "Sabah evden çıktığımızda hava sıcak ve güneşliydi, çocuklar nehre giden yolda önümüzden "
        "koşuyorlardı. Yazın ilk günlerinde herkesin dışarıda olmak istemesine neden olan bir şey"
        " var. Tatil için planladığımız geziden ve şehirde buluşacağımız arkadaşlardan konuştuk. "
        "Babam eski köprünün tamir için kapatıldığını söyledi, bu yüzden ormanın içinden geçen "
        "diğer yolu kullanmak zorunda kaldık. Öğleden sonra küçük bir köyün yakınında yemek için "
        "durduk, insanlar çok cana yakındı ve yemekler haftalardır yediğimiz her şeyden daha "
        "güzeldi. Ondan sonra kuşlara ve çiçeklere bakarak bir saat daha yürüdük, ışık azalmaya "
        "başlayana ve eve dönme zamanı gelene kadar. Bu hikaye hayattaki basit şeylerin tadını "
        "çıkarmayı nasıl öğrendiğimizi ve aileyle kısa bir yürüyüşün yılın en güzel anı "
        "olabileceğini anlatıyor. Bu videoyu izlediğiniz için teşekkür ederiz, düşüncelerinizi "
        "yorumlarda bizimle paylaşın. Bugün size mutfağınızdaki sadece üç malzemeyle harika bir "
        "akşam yemeğinin nasıl hazırlanacağını göstereceğiz. Şirketin başkanıyla yapılan "
        "röportaj, yeni ürünler hakkındaki raporla birlikte gelecek hafta yayınlanacak. Geçen yıl"
        " ilk kez denize gittiğimizde otelimiz sahile çok yakındı ve her sabah kahvaltıdan sonra "
        "yüzmeye gidiyorduk. Akşamları şehrin eski sokaklarında dolaşıp küçük dükkanlardan "
        "hediyeler aldık. Bu bölümde size gezdiğimiz yerleri, yediğimiz yemekleri ve tanıştığımız"
        " insanları anlatacağız. Kanalımıza abone olmayı ve videoyu beğenmeyi unutmayın, bir "
        "sonraki videoda görüşmek üzere."},
    {"pol",
        "Pogoda była ciepła i słoneczna, kiedy rano wychodziliśmy z domu, a dzieci biegły przed "
        "nami drogą prowadzącą do rzeki. Jest coś w pierwszych dniach lata, co sprawia, że "
        "wszyscy chcą być na zewnątrz. Rozmawialiśmy o wycieczce, którą zaplanowaliśmy na "
        "wakacje, i o przyjaciołach, których mieliśmy spotkać w mieście. Mój ojciec powiedział, "
        "że stary most jest zamknięty z powodu remontu, więc musieliśmy pójść inną drogą przez "
        "las. Po południu zatrzymaliśmy się na obiad niedaleko małej wioski, gdzie ludzie byli "
        "bardzo życzliwi, a jedzenie było lepsze niż wszystko, co jedliśmy od tygodni. Potem "
        "szliśmy jeszcze przez godzinę, patrząc na ptaki i kwiaty, aż światło zaczęło gasnąć i "
        "trzeba było wracać do domu. To jest historia o tym, jak nauczyliśmy się cieszyć prostymi"
        " rzeczami w życiu i jak krótki spacer z rodziną może być najlepszą częścią całego roku. "
        "Dziękujemy za obejrzenie tego filmu i napiszcie nam w komentarzach, co o tym myślicie. "
        "Dzisiaj pokażemy wam, jak przygotować wspaniałą kolację tylko z trzech składników z "
        "waszej kuchni. Wywiad z prezesem firmy zostanie opublikowany w przyszłym tygodniu, razem"
        " z raportem o nowych produktach."},
    {"swe",
        "Vädret var varmt och klart när vi lämnade huset på morgonen, och barnen sprang före oss "
        "längs vägen ner till floden. Det är något med sommarens första dagar som får alla att "
        "vilja vara ute. Vi pratade om resan som vi hade planerat för semestern och om vännerna "
        "som vi skulle träffa i staden. Min pappa sa att den gamla bron var stängd för "
        "reparationer, så vi fick ta den andra vägen genom skogen. På eftermiddagen stannade vi "
        "för att äta lunch nära en liten by där människorna var mycket vänliga och maten var "
        "bättre än allt vi hade ätit på flera veckor. Sedan gick vi en timme till och tittade på "
        "fåglarna och blommorna, tills ljuset började försvinna och det var dags att gå hem. Det "
        "här är en berättelse om hur vi lärde oss att njuta av de enkla sakerna i livet, och hur "
        "en kort promenad med familjen kan vara den bästa delen av hela året. Tack för att du "
        "tittade på den här videon, och berätta gärna vad du tycker i kommentarerna. I dag ska vi"
        " visa hur man lagar en fantastisk middag med bara tre saker från köket. Intervjun med "
        "företagets ordförande kommer att publiceras nästa vecka tillsammans med rapporten om de "
        "nya produkterna."},
    {"ind",
        "Cuaca hangat dan cerah ketika kami meninggalkan rumah pada pagi hari, dan anak-anak "
        "berlari di depan kami di sepanjang jalan menuju sungai. Ada sesuatu pada hari-hari "
        "pertama musim kemarau yang membuat semua orang ingin berada di luar. Kami berbicara "
        "tentang perjalanan yang sudah kami rencanakan untuk liburan dan tentang teman-teman yang"
        " akan kami temui di kota. Ayah saya mengatakan bahwa jembatan lama sedang ditutup untuk "
        "perbaikan, jadi kami harus mengambil jalan lain melalui hutan. Pada sore hari kami "
        "berhenti untuk makan siang di dekat sebuah desa kecil di mana orang-orangnya sangat "
        "ramah dan makanannya lebih enak daripada semua yang kami makan selama berminggu-minggu. "
        "Setelah itu kami berjalan satu jam lagi, melihat burung dan bunga, sampai cahaya mulai "
        "memudar dan sudah waktunya pulang. Ini adalah cerita tentang bagaimana kami belajar "
        "menikmati hal-hal sederhana dalam kehidupan, dan bagaimana jalan-jalan singkat dengan "
        "keluarga bisa menjadi bagian terbaik dari seluruh tahun. Terima kasih sudah menonton "
        "video ini, dan beri tahu kami pendapat kalian di kolom komentar. Hari ini kami akan "
        "menunjukkan cara memasak makan malam yang lezat hanya dengan tiga bahan dari dapur "
        "kalian. Wawancara dengan direktur perusahaan akan diterbitkan minggu depan, bersama "
        "dengan laporan tentang produk-produk baru."},
    {"vie",
        "Thời tiết ấm áp và trong lành khi chúng tôi rời khỏi nhà vào buổi sáng, và những đứa trẻ"
        " chạy trước chúng tôi trên con đường dẫn ra bờ sông. Có một điều gì đó trong những ngày "
        "đầu tiên của mùa hè khiến mọi người đều muốn ra ngoài. Chúng tôi nói về chuyến đi mà "
        "chúng tôi đã lên kế hoạch cho kỳ nghỉ và về những người bạn mà chúng tôi sẽ gặp trong "
        "thành phố. Cha tôi nói rằng cây cầu cũ đã bị đóng cửa để sửa chữa, vì vậy chúng tôi phải"
        " đi đường khác qua khu rừng. Vào buổi chiều chúng tôi dừng lại ăn trưa gần một ngôi làng"
        " nhỏ, nơi người dân rất thân thiện và đồ ăn ngon hơn tất cả những gì chúng tôi đã ăn "
        "trong nhiều tuần. Sau đó chúng tôi đi bộ thêm một giờ nữa, ngắm nhìn những con chim và "
        "những bông hoa, cho đến khi ánh sáng bắt đầu tắt dần và đã đến lúc về nhà. Đây là câu "
        "chuyện về cách chúng tôi học được cách tận hưởng những điều đơn giản trong cuộc sống. "
        "Cảm ơn các bạn đã xem video này, và hãy cho chúng tôi biết suy nghĩ của các bạn trong "
        "phần bình luận. Hôm nay chúng tôi sẽ hướng dẫn các bạn cách nấu một bữa tối tuyệt vời "
        "chỉ với ba nguyên liệu trong bếp. Cuộc phỏng vấn với giám đốc công ty sẽ được đăng vào "
        "tuần tới, cùng với báo cáo về các sản phẩm mới."},
    {"ces",
        "Počasí bylo teplé a jasné, když jsme ráno odcházeli z domu, a děti běžely před námi po "
        "cestě, která vede k řece. Na prvních dnech léta je něco, kvůli čemu chce být každý "
        "venku. Mluvili jsme o výletě, který jsme si naplánovali na prázdniny, a o přátelích, se "
        "kterými jsme se měli setkat ve městě. Můj otec řekl, že starý most je zavřený kvůli "
        "opravě, takže jsme museli jít jinou cestou přes les. Odpoledne jsme se zastavili na oběd"
        " u malé vesnice, kde byli lidé velmi přátelští a jídlo bylo lepší než všechno, co jsme "
        "jedli za poslední týdny. Potom jsme šli ještě hodinu dál, dívali jsme se na ptáky a na "
        "květiny, dokud světlo nezačalo slábnout a nebyl čas jít domů. Toto je příběh o tom, jak "
        "jsme se naučili užívat si jednoduché věci v životě a jak může být krátká procházka s "
        "rodinou tou nejlepší částí celého roku. Děkujeme, že jste se podívali na toto video, a "
        "napište nám do komentářů, co si o tom myslíte. Dnes vám ukážeme, jak připravit skvělou "
        "večeři jen ze tří surovin z vaší kuchyně. Rozhovor s ředitelem společnosti bude "
        "zveřejněn příští týden spolu se zprávou o nových výrobcích."},
};

std::vector<TrigramProfile> builtin_profiles() {
    std::vector<TrigramProfile> profiles;
    for (const auto& [code, text] : kReferenceTexts) {
        profiles.push_back(TrigramClassifier::profile_from_text(code, text));
    }
    return profiles;
}

bool is_word_char(const char32_t cp) {
    if (cp >= U'a' && cp <= U'z') return true;
    if (cp >= U'A' && cp <= U'Z') return true;
    return cp >= 0xC0 && cp != 0xD7 && cp != 0xF7 && cp != 0xFFFD;
}

} // namespace

TrigramClassifier::TrigramClassifier(std::vector<TrigramProfile> profiles)
    : profiles_(std::move(profiles)) {}

const TrigramClassifier& TrigramClassifier::builtin() {
    static const TrigramClassifier instance(builtin_profiles());
    return instance;
}

std::vector<std::string> TrigramClassifier::ranked_trigrams(const std::string_view phrase) {
    std::map<std::string, int> counts;
    std::vector<std::string> first_seen;

    std::vector<char32_t> word;
    auto flush_word = [&] {
        if (word.empty()) return;
        std::vector<char32_t> padded;
        padded.reserve(word.size() + 2);
        padded.push_back(U' ');
        padded.insert(padded.end(), word.begin(), word.end());
        padded.push_back(U' ');
        for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
            std::string gram;
            for (std::size_t k = i; k < i + 3; ++k) text::append_utf8(gram, padded[k]);
            if (counts[gram]++ == 0) first_seen.push_back(gram);
        }
        word.clear();
    };

    for (const char32_t cp : text::decode_utf8(text::to_lower(phrase))) {
        if (is_word_char(cp)) {
            word.push_back(cp);
        } else {
            flush_word();
        }
    }
    flush_word();

    // stable: equal counts keep first-occurrence order
    std::ranges::stable_sort(first_seen, [&](const std::string& a, const std::string& b) {
        return counts[a] > counts[b];
    });
    return first_seen;
}

TrigramProfile TrigramClassifier::profile_from_text(std::string code, const std::string_view text,
                                                     const std::size_t size) {
    auto trigrams = ranked_trigrams(text);
    if (trigrams.size() > size) trigrams.resize(size);
    return TrigramProfile{std::move(code), std::move(trigrams)};
}

std::optional<LanguageGuess> TrigramClassifier::classify(const std::string_view phrase) const {
    const auto input = ranked_trigrams(phrase);
    if (input.empty() || profiles_.empty()) return std::nullopt;

    long best = std::numeric_limits<long>::max();
    long second = std::numeric_limits<long>::max();
    const TrigramProfile* winner = nullptr;

    for (const auto& profile : profiles_) {
        std::unordered_map<std::string_view, int> ranks;
        for (std::size_t r = 0; r < profile.trigrams.size(); ++r) {
            ranks.emplace(profile.trigrams[r], static_cast<int>(r));
        }
        long distance = 0;
        for (std::size_t r = 0; r < input.size(); ++r) {
            const auto it = ranks.find(input[r]);
            distance += it == ranks.end()
                            ? kMaxRankDifference
                            : std::min(kMaxRankDifference, std::abs(it->second - static_cast<int>(r)));
        }
        if (distance < best) {
            second = best;
            best = distance;
            winner = &profile;
        } else if (distance < second) {
            second = distance;
        }
    }

    if (!winner || best == second) return std::nullopt;

    const double worst = static_cast<double>(input.size()) * kMaxRankDifference;
    return LanguageGuess{winner->code, 1.0 - static_cast<double>(best) / worst};
}

} // namespace subsmith
